#include "cmd/executor.hpp"

#include <type_traits>
#include <utility>

namespace respkv::cmd {

const resp::Frame& ok_reply() {
    static const resp::Frame ok = resp::Frame::simple("OK");
    return ok;
}

resp::Frame execute(Command command, storage::Backend& backend) {
    using resp::Frame;

    return std::visit(
        [&backend](auto&& c) -> Frame {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, Get>) {
                return backend.get(c.key).value_or(Frame::null());

            } else if constexpr (std::is_same_v<T, Set>) {
                backend.set(std::move(c.key), std::move(c.value));
                return ok_reply();

            } else if constexpr (std::is_same_v<T, HGet>) {
                return backend.hget(c.key, c.field).value_or(Frame::null());

            } else if constexpr (std::is_same_v<T, HSet>) {
                backend.hset(std::move(c.key), std::move(c.field), std::move(c.value));
                return ok_reply();

            } else if constexpr (std::is_same_v<T, HGetAll>) {
                auto fields = backend.hgetall(c.key);
                if (!fields) {
                    return Frame::array({});
                }
                return Frame::map(std::move(*fields));

            } else if constexpr (std::is_same_v<T, HMGet>) {
                auto values = backend.hmget(c.key, c.fields);
                if (!values) {
                    return Frame::array({});
                }
                return Frame::array(std::move(*values));

            } else if constexpr (std::is_same_v<T, Echo>) {
                return backend.echo(c.text).value_or(Frame::null());

            } else if constexpr (std::is_same_v<T, Sadd>) {
                return Frame::integer(backend.sadd(std::move(c.key), std::move(c.item)));

            } else if constexpr (std::is_same_v<T, Sismember>) {
                return Frame::integer(backend.sismember(c.key, c.item));

            } else if constexpr (std::is_same_v<T, Unrecognized>) {
                return ok_reply();
            }
        },
        std::move(command));
}

} // namespace respkv::cmd
