#include "osync/core/ids.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>

namespace osync {

std::string generate_uuid() {
    static std::mutex mutex;
    static boost::uuids::random_generator generator;

    std::lock_guard lock(mutex);
    return boost::uuids::to_string(generator());
}

} // namespace osync
