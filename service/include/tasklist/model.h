#ifndef TASKLIST_MODEL_H
#define TASKLIST_MODEL_H

#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <boost/json.hpp>
#include <charconv>
#include <optional>
#include <string>
#include <type_traits>

// usage: TASKLIST_MODEL(TodoFields, title, description)
#define TASKLIST_MODEL(Type, ...) BOOST_DESCRIBE_STRUCT(Type, (), (__VA_ARGS__))

namespace tasklist::detail {

// Text members take any JSON scalar. Numbers and booleans read as their
// literal text; null, arrays and objects read as absent.
inline std::optional<std::string> scalar_text(boost::json::value const& jv) {
    switch (jv.kind()) {
    case boost::json::kind::string:
        return std::string(jv.get_string());
    case boost::json::kind::bool_:
        return std::string(jv.get_bool() ? "true" : "false");
    case boost::json::kind::int64:
        return std::to_string(jv.get_int64());
    case boost::json::kind::uint64:
        return std::to_string(jv.get_uint64());
    case boost::json::kind::double_: {
        char buf[32];
        auto res = std::to_chars(buf, buf + sizeof(buf), jv.get_double());
        return std::string(buf, res.ptr);
    }
    default:
        return std::nullopt;
    }
}

template<class M>
M member_from(boost::json::value const& jv) {
    if constexpr (std::is_same_v<M, std::optional<std::string>>) {
        return scalar_text(jv);
    } else {
        return boost::json::value_to<M>(jv);
    }
}

} // namespace tasklist::detail

// Global tag_invoke for Boost.JSON -> Boost.Describe serialization
namespace boost::json {

template<class T>
typename std::enable_if<
    boost::describe::has_describe_members<T>::value,
    void
>::type
tag_invoke(value_from_tag, value& jv, T const& t) {
    object obj;
    boost::mp11::mp_for_each<boost::describe::describe_members<T, boost::describe::mod_any_access>>(
        [&](auto D) {
            obj[D.name] = value_from(t.*D.pointer);
        }
    );
    jv = std::move(obj);
}

// Keys missing from the object leave the member default-constructed.
// A value that is not an object yields a fully defaulted T.
template<class T>
typename std::enable_if<
    boost::describe::has_describe_members<T>::value,
    T
>::type
tag_invoke(value_to_tag<T>, value const& jv) {
    T t{};
    if (!jv.is_object()) {
        return t;
    }
    object const& obj = jv.get_object();
    boost::mp11::mp_for_each<boost::describe::describe_members<T, boost::describe::mod_any_access>>(
        [&](auto D) {
            if (obj.contains(D.name)) {
                using M = typename std::remove_reference<decltype(t.*D.pointer)>::type;
                t.*D.pointer = tasklist::detail::member_from<M>(obj.at(D.name));
            }
        }
    );
    return t;
}

} // namespace boost::json

#endif
