#ifndef GRAFT_ERROR_H_INCLUDED
#define GRAFT_ERROR_H_INCLUDED

#include "graft/def.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Defines all possible error codes.
 * Every error is a violation of a tree operation's contract and is reported
 * before the tree has been modified.
 */
typedef enum graft_errc_t {
    GRAFT_OK = 0,
    GRAFT_ERROR_NOT_A_CHILD = 1,      /* Node is not a child of the given parent */
    GRAFT_ERROR_ALREADY_ATTACHED = 2, /* Node already has a parent */
    GRAFT_ERROR_EMPTY_SUBTREE = 3,    /* Composite without children where a token was expected */
    GRAFT_ERROR_SELF_REFERENCE = 4,   /* Operation would create a cycle */
    GRAFT_ERROR_NOT_COMPOSITE = 5,    /* Operation requires a composite node */
    GRAFT_ERROR_BAD_NODE = 6,         /* Invalid or discarded node handle */
    GRAFT_ERROR_BAD_ARG = 7,          /* Invalid argument */
    GRAFT_ERROR_INTERNAL = 1000,      /* Internal error */
} graft_errc_t;

/**
 * Returns the name of the given error code.
 * The string points into static storage and must not be freed.
 */
GRAFT_API const char* graft_errc_name(graft_errc_t e);

/**
 * Returns a human readable description of the given error code.
 * The string points into static storage and must not be freed.
 */
GRAFT_API const char* graft_errc_message(graft_errc_t e);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif // GRAFT_ERROR_H_INCLUDED
