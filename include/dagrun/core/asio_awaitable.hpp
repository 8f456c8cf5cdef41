#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace dagrun {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

} // namespace dagrun
