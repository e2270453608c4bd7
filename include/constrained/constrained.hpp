#ifndef CONSTRAINED_CONSTRAINED_HPP
#define CONSTRAINED_CONSTRAINED_HPP

#include <constrained/type_set.hpp>
#include <constrained/pretty.hpp>
#include <constrained/errors.hpp>
#include <constrained/marker.hpp>
#include <constrained/element.hpp>
#include <constrained/registry.hpp>
#include <constrained/declaration.hpp>
#include <constrained/list.hpp>

#endif // CONSTRAINED_CONSTRAINED_HPP
