#include "upload/CredentialProvider.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace capturelink {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

std::string EnvCredentialProvider::bearer_token() {
    const char* env = std::getenv(variable_.c_str());
    if (!env) return {};
    return trim(env);
}

std::string FileCredentialProvider::bearer_token() {
    std::ifstream f(path_);
    if (!f) {
        std::cerr << "[Credentials] unable to read token file: " << path_ << std::endl;
        return {};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return trim(ss.str());
}

} // namespace capturelink
