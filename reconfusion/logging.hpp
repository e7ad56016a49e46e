// logging.hpp
#ifndef RECONFUSION_LOGGING_HPP_
#define RECONFUSION_LOGGING_HPP_

#include <stdexcept> // For std::runtime_error
#include <string>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace reconfusion {

/**
 * @brief Parses a severity name (trace, debug, info, warning, error, fatal).
 * @throws std::runtime_error on an unknown name.
 */
inline boost::log::trivial::severity_level parseSeverity(const std::string& name) {
    boost::log::trivial::severity_level level;
    if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
        throw std::runtime_error("Unknown log level '" + name + "'.");
    }
    return level;
}

/**
 * @brief Installs a global severity filter on the Boost.Log core.
 * Records below the given level are discarded. Library code only emits
 * records; the application decides what is shown.
 */
inline void initLogging(boost::log::trivial::severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace reconfusion

#endif // RECONFUSION_LOGGING_HPP_
