#ifndef TASKLIST_ASYNC_H
#define TASKLIST_ASYNC_H

#include <boost/asio/awaitable.hpp>

namespace tasklist {

template <typename T = void>
using Async = boost::asio::awaitable<T>;

} // namespace tasklist

#endif
