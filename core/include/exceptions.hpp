#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class PostFactoException : public std::runtime_error {
    public:
        explicit PostFactoException(const std::string& message)
            : std::runtime_error(message) {}

        explicit PostFactoException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public PostFactoException {
    public: using PostFactoException::PostFactoException; };

    class DataLoadException : public PostFactoException {
    public: using PostFactoException::PostFactoException; };

    class StrategyException : public PostFactoException {
    public: using PostFactoException::PostFactoException; };

    class BacktestException : public PostFactoException {
    public: using PostFactoException::PostFactoException; };

    // Raised when an action stream cannot be reconciled into trade pairs
    class PairingException : public BacktestException {
    public: using BacktestException::BacktestException; };

} // namespace core
