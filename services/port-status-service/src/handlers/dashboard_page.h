#pragma once

/**
 * @file dashboard_page.h
 * @brief Static operator dashboard served at /
 *
 * The page only renders what /ports, /services and /containers return.
 */

#include <string_view>

namespace handlers {

std::string_view dashboardHtml();

} // namespace handlers
