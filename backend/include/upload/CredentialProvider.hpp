#pragma once

#include <string>

namespace capturelink {

// Supplies the bearer token for each request. An empty token means "not authenticated".
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    virtual std::string bearer_token() = 0;
};

class StaticCredentialProvider : public CredentialProvider {
public:
    explicit StaticCredentialProvider(std::string token) : token_(std::move(token)) {}
    std::string bearer_token() override { return token_; }

private:
    std::string token_;
};

// Reads the named environment variable on every call.
class EnvCredentialProvider : public CredentialProvider {
public:
    explicit EnvCredentialProvider(std::string variable) : variable_(std::move(variable)) {}
    std::string bearer_token() override;

private:
    std::string variable_;
};

// Re-reads the token file on every call so an external refresher can rotate it.
class FileCredentialProvider : public CredentialProvider {
public:
    explicit FileCredentialProvider(std::string path) : path_(std::move(path)) {}
    std::string bearer_token() override;

private:
    std::string path_;
};

} // namespace capturelink
