#pragma once

#include <string>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace IdGenerator {
    // random_generator is not thread safe; one per thread.
    inline std::string next() {
        thread_local boost::uuids::random_generator generator;
        return boost::uuids::to_string(generator());
    }
}
