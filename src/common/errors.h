#ifndef PAGESTREAM_SRC_COMMON_ERRORS_H_
#define PAGESTREAM_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Pagestream {

/**
 * The queue or counter store could not complete an operation.
 * Callers retry with backoff or, on the ingest path, drop the side effect.
 */
class TransientStoreError : public std::runtime_error {
public:
    explicit TransientStoreError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Startup cannot proceed (storage root not creatable, queue log not
 * openable, invalid configuration).
 */
class FatalConfigError : public std::runtime_error {
public:
    explicit FatalConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace Pagestream

#endif // PAGESTREAM_SRC_COMMON_ERRORS_H_
