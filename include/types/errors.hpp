#pragma once

#include <stdexcept>

namespace mds::types {

// Malformed source definition, rejected before anything is persisted
struct ValidationError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

struct NotFoundError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// SQLite failure in the state store
struct StoreError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
