#ifndef GIFSEQ_EXCEPTION_H
#define GIFSEQ_EXCEPTION_H

#include <exception>
#include <string>

namespace GIFSeq {

// unusable input patterns or files
class InputException final : public std::exception {
  public:
    explicit InputException(const std::string&& msg)
        : msg(msg) {}

    [[nodiscard]] const char*
    what() const noexcept override {
        return msg.c_str();
    }

  private:
    std::string msg;
};

// parameters or frames that cannot form a valid animation
class ValidationException final : public std::exception {
  public:
    explicit ValidationException(const std::string&& msg)
        : msg(msg) {}

    [[nodiscard]] const char*
    what() const noexcept override {
        return msg.c_str();
    }

  private:
    std::string msg;
};

}  // namespace GIFSeq

#endif  // GIFSEQ_EXCEPTION_H
