#pragma once
#include <string>

namespace asap::util {

// Load KEY=VALUE pairs from the first .env found near the working directory
// or the executable. Variables already present in the environment win.
void load_dotenv();

std::string env_string(const std::string& key, const std::string& fallback = "");
int env_int(const std::string& key, int fallback);
double env_double(const std::string& key, double fallback);
bool env_bool(const std::string& key, bool fallback);

} // namespace asap::util
