#ifndef LISE_HPP
#define LISE_HPP

// Main header that includes everything

#include <lise/application.hpp>
#include <lise/config.hpp>
#include <lise/errors.hpp>
#include <lise/launcher.hpp>
#include <lise/startup.hpp>
#include <lise/types.hpp>
#include <lise/version.hpp>

#endif // LISE_HPP
