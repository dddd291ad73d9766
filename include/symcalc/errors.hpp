#ifndef SYMCALC_ERRORS_HPP
#define SYMCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace symcalc {

// --- Error hierarchy: only compute() and nth_root() throw ---

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UnboundVariable : Error {
    explicit UnboundVariable(const std::string& name)
        : Error("'" + name + "' was not defined"), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

struct DivisionByZero : Error {
    DivisionByZero() : Error("division by zero") {}
};

struct InvalidDomain : Error {
    using Error::Error;
};

} // namespace symcalc

#endif // SYMCALC_ERRORS_HPP
