#pragma once

#include <stdexcept>
#include <string>

namespace lexicon {

    enum class ErrorCode {
        AlreadyOpen,
        AlreadyOpening,
        NotOpen,
        CannotPurgeWhileOpening,
        Storage,
        Decode
    };

    inline const char* errorCodeName(ErrorCode code) {
        switch (code) {
            case ErrorCode::AlreadyOpen: return "AlreadyOpen";
            case ErrorCode::AlreadyOpening: return "AlreadyOpening";
            case ErrorCode::NotOpen: return "NotOpen";
            case ErrorCode::CannotPurgeWhileOpening: return "CannotPurgeWhileOpening";
            case ErrorCode::Storage: return "Storage";
            case ErrorCode::Decode: return "Decode";
        }
        return "Unknown";
    }

    class DatabaseError : public std::runtime_error {
    public:
        DatabaseError(ErrorCode code, const std::string& message)
            : std::runtime_error(message), code_(code) {}

        ErrorCode code() const { return code_; }

    private:
        ErrorCode code_;
    };
}
