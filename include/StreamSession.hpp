#pragma once
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <string>

namespace wsb {

// One upstream streaming connection. Handlers run on the owning io_context.
// At most one operation is outstanding at a time; the session must outlive
// the completion of that operation.
class IStreamSession {
public:
    using OpenHandler = std::function<void(const boost::system::error_code&)>;
    using ReadHandler = std::function<void(const boost::system::error_code&, std::string frame)>;

    virtual ~IStreamSession() = default;

    virtual void asyncOpen(OpenHandler handler) = 0;
    virtual void asyncRead(ReadHandler handler) = 0;

    // Drops the connection; an outstanding operation completes with an error.
    virtual void close() = 0;

    // Human-readable endpoint for logs.
    virtual std::string endpoint() const = 0;
};

using SessionFactory = std::function<std::unique_ptr<IStreamSession>()>;

} // namespace wsb
