#pragma once

#include <stdexcept>
#include <string>

namespace netrecon {

// =====================
// 配置错误
// =====================
// 扫描开始前抛出；main 捕获后打印并以非零码退出
// input() 保存触发错误的原始输入

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message, std::string input)
        : std::runtime_error(message), input_(std::move(input)) {}

    const std::string& input() const { return input_; }

private:
    std::string input_;
};

class InvalidAddress : public ConfigurationError {
public:
    explicit InvalidAddress(const std::string& input)
        : ConfigurationError("invalid address '" + input + "'", input) {}
};

class InvalidRange : public ConfigurationError {
public:
    InvalidRange(const std::string& input, const std::string& reason)
        : ConfigurationError("invalid address range '" + input + "': " + reason, input) {}
};

class InvalidCIDR : public ConfigurationError {
public:
    InvalidCIDR(const std::string& input, const std::string& reason)
        : ConfigurationError("invalid CIDR block '" + input + "': " + reason, input) {}
};

class InvalidPortRange : public ConfigurationError {
public:
    InvalidPortRange(const std::string& input, const std::string& reason)
        : ConfigurationError("invalid port range '" + input + "': " + reason, input) {}
};

class InvalidPortList : public ConfigurationError {
public:
    InvalidPortList(const std::string& input, const std::string& reason)
        : ConfigurationError("invalid port list '" + input + "': " + reason, input) {}
};

} // namespace netrecon
