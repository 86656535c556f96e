#ifndef GRAFT_DEF_H_INCLUDED
#define GRAFT_DEF_H_INCLUDED

/**
 * \file
 * \brief Contains basic type and macro definitions.
 *
 * This file is included by all other public headers.
 */

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(__CYGWIN__)
#    ifdef GRAFT_BUILDING_LIBRARY
#        ifdef __GNUC__
#            define GRAFT_API __attribute__((dllexport))
#        else
#            define GRAFT_API __declspec(dllexport)
#        endif
#    else
#        ifdef __GNUC__
#            define GRAFT_API __attribute__((dllimport))
#        else
#            define GRAFT_API __declspec(dllimport)
#        endif
#    endif
#else
#    define GRAFT_API __attribute__((visibility("default")))
#endif

#endif // GRAFT_DEF_H_INCLUDED
