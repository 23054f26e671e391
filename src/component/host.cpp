/// @file host.cpp
/// @brief BasicHost implementation for keystone_component

#include <keystone/component/host.hpp>
#include <keystone/core/log.hpp>

namespace keystone_component {

BasicHost::BasicHost(std::string name)
    : m_name(std::move(name))
    , m_logger(keystone_core::get_logger(m_name))
{
}

BasicHost::BasicHost(std::string name, std::shared_ptr<spdlog::logger> logger)
    : m_name(std::move(name))
    , m_logger(logger ? std::move(logger) : keystone_core::get_logger(m_name))
{
}

} // namespace keystone_component
