#ifndef SYMCALC_SYMCALC_HPP
#define SYMCALC_SYMCALC_HPP

#include <symcalc/errors.hpp>
#include <symcalc/expr.hpp>
#include <symcalc/constants.hpp>
#include <symcalc/math.hpp>
#include <symcalc/nth_root.hpp>
#include <symcalc/compute.hpp>
#include <symcalc/equal.hpp>
#include <symcalc/pretty_print.hpp>
#include <symcalc/simplify.hpp>
#include <symcalc/differentiate.hpp>
#include <symcalc/transforms.hpp>

#endif // SYMCALC_SYMCALC_HPP
