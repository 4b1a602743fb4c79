#include "Status.hpp"

namespace atomrt::util {

const char* Status::message() const noexcept {
    return message_.data();
}

Status Status::Ok() {
    return Status{Code::Ok, ""};
}

bool Status::isOk() const noexcept {
    return code_ == Code::Ok;
}

bool Status::isInvalidArgument() const noexcept {
    return code_ == Code::InvalidArgument;
}

}
