#pragma once

#include <exception>
#include <string>
#include <unordered_map>

// Values double as the process exit status.
enum class MungerErrorCode {
    Invalid_Arguments = 1,
    Unreadable_File = 2,
    Invalid_Encoding = 3,
    Unwritable_File = 4,
};

static const std::unordered_map<MungerErrorCode, const std::string> MungerErrorMessages = {
    {MungerErrorCode::Invalid_Arguments, "Invalid arguments"},
    {MungerErrorCode::Unreadable_File, "Could not read schedule file"},
    {MungerErrorCode::Invalid_Encoding, "Schedule file is not valid UTF-8"},
    {MungerErrorCode::Unwritable_File, "Could not write output file"}};

class MungerError : public std::exception {
  public:
    MungerError() = delete;
    MungerError(const MungerErrorCode code) : _code(code) {}
    MungerError(const MungerErrorCode code, const std::string& context)
        : _code(code), _context_message(MungerErrorMessages.at(_code) + ": " + context) {}

    MungerErrorCode code() const { return _code; }
    int exit_status() const { return static_cast<int>(_code); }

    const char* what() const noexcept override {
        if (_context_message.empty()) {
            return MungerErrorMessages.at(_code).c_str();
        } else {
            return _context_message.c_str();
        }
    }

  private:
    MungerErrorCode _code;
    std::string _context_message;
};

#define MungerException(name, code)                                                                \
    class name : public MungerError {                                                              \
      public:                                                                                      \
        name() : MungerError(code) {}                                                              \
        name(const std::string& context) : MungerError(code, context) {}                           \
    }

MungerException(InvalidArgumentsError, MungerErrorCode::Invalid_Arguments);
MungerException(UnreadableFileError, MungerErrorCode::Unreadable_File);
MungerException(InvalidEncodingError, MungerErrorCode::Invalid_Encoding);
MungerException(UnwritableFileError, MungerErrorCode::Unwritable_File);

#undef MungerException
