#include "graft/error.h"

const char* graft_errc_name(graft_errc_t e) {
    switch (e) {
#define GRAFT_ERRC_NAME(X) \
    case GRAFT_##X:        \
        return #X;

        GRAFT_ERRC_NAME(OK)
        GRAFT_ERRC_NAME(ERROR_NOT_A_CHILD)
        GRAFT_ERRC_NAME(ERROR_ALREADY_ATTACHED)
        GRAFT_ERRC_NAME(ERROR_EMPTY_SUBTREE)
        GRAFT_ERRC_NAME(ERROR_SELF_REFERENCE)
        GRAFT_ERRC_NAME(ERROR_NOT_COMPOSITE)
        GRAFT_ERRC_NAME(ERROR_BAD_NODE)
        GRAFT_ERRC_NAME(ERROR_BAD_ARG)
        GRAFT_ERRC_NAME(ERROR_INTERNAL)

#undef GRAFT_ERRC_NAME
    }
    return "unknown error code";
}

const char* graft_errc_message(graft_errc_t e) {
    switch (e) {
#define GRAFT_ERRC_MESSAGE(X, str) \
    case GRAFT_##X:                \
        return str;

        GRAFT_ERRC_MESSAGE(OK, "no error")
        GRAFT_ERRC_MESSAGE(ERROR_NOT_A_CHILD, "the node is not a child of the given parent")
        GRAFT_ERRC_MESSAGE(ERROR_ALREADY_ATTACHED, "the node is already attached to a parent")
        GRAFT_ERRC_MESSAGE(
            ERROR_EMPTY_SUBTREE, "reached a composite node without children where a token was expected")
        GRAFT_ERRC_MESSAGE(ERROR_SELF_REFERENCE, "the operation would make a node its own descendant")
        GRAFT_ERRC_MESSAGE(ERROR_NOT_COMPOSITE, "the operation is only supported on composite nodes")
        GRAFT_ERRC_MESSAGE(ERROR_BAD_NODE, "the node handle does not refer to a live node")
        GRAFT_ERRC_MESSAGE(ERROR_BAD_ARG, "invalid argument")
        GRAFT_ERRC_MESSAGE(ERROR_INTERNAL, "an internal error occurred")

#undef GRAFT_ERRC_MESSAGE
    }
    return "unknown error";
}
