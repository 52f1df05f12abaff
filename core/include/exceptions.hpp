#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class AnalysisPlatformException : public std::runtime_error {
    public:
        explicit AnalysisPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit AnalysisPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public AnalysisPlatformException {
    public: using AnalysisPlatformException::AnalysisPlatformException; };

    class DataLoadException : public AnalysisPlatformException {
    public: using AnalysisPlatformException::AnalysisPlatformException; };

    class StorageException : public AnalysisPlatformException {
    public: using AnalysisPlatformException::AnalysisPlatformException; };

    class IndicatorCalculationException : public AnalysisPlatformException {
    public: using AnalysisPlatformException::AnalysisPlatformException; };

    // Too few bars for the scoring precondition. Scoped to one instrument/date.
    class InsufficientHistoryException : public AnalysisPlatformException {
    public:
        InsufficientHistoryException(const std::string& message, std::size_t available, std::size_t required)
            : AnalysisPlatformException(message), available_(available), required_(required) {}

        std::size_t available() const { return available_; }
        std::size_t required() const { return required_; }

    private:
        std::size_t available_;
        std::size_t required_;
    };

    // No overlapping dates between an instrument's analysis results and its bars
    class EmptyJoinException : public AnalysisPlatformException {
    public: using AnalysisPlatformException::AnalysisPlatformException; };

} // namespace core
