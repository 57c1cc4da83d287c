#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace sdet {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
    virtual const char* kind() const noexcept = 0;
};

#define SDET_DECLARE_ERROR(Name)                                        \
    class Name : public Error {                                         \
    public:                                                             \
        using Error::Error;                                             \
        const char* kind() const noexcept override { return #Name; }    \
    }

// stream boundary, retried by the stage that owns the connection
SDET_DECLARE_ERROR(ConnectionError);
SDET_DECLARE_ERROR(StreamEnded);
SDET_DECLARE_ERROR(PublishTimeout);
// per frame, the frame is dropped
SDET_DECLARE_ERROR(DecodeError);
SDET_DECLARE_ERROR(InferenceError);
SDET_DECLARE_ERROR(EncodeError);
// session start, reported to the caller
SDET_DECLARE_ERROR(ModelLoadError);
SDET_DECLARE_ERROR(InvalidConfig);
SDET_DECLARE_ERROR(SessionAlreadyActive);
SDET_DECLARE_ERROR(NoActiveSession);

#undef SDET_DECLARE_ERROR

class StageFailed : public Error {
public:
    StageFailed(std::string stage, const std::string& what)
        : Error(stage + ": " + what), stage_(std::move(stage)) {}
    const char* kind() const noexcept override { return "StageFailed"; }
    const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};
}
