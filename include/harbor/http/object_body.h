#pragma once

#include <array>
#include <cstdint>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>

#include "harbor/storage/file_driver.h"

namespace harbor::http {

/// @brief Beast body that streams a window of a resident object through storage::ObjectReader.
struct ObjectBody {
    using value_type = storage::ObjectReader;

    static std::uint64_t size(const value_type& body) { return body.length(); }

    class writer {
    public:
        using const_buffers_type = boost::asio::const_buffer;

        template <bool isRequest, class Fields>
        writer(boost::beast::http::header<isRequest, Fields>&, value_type& body) : body_(body) {}

        void init(boost::beast::error_code& ec) { ec = {}; }

        boost::optional<std::pair<const_buffers_type, bool>> get(boost::beast::error_code& ec) {
            if (body_.remaining() == 0) {
                ec = {};
                return boost::none;
            }
            auto read = body_.Read(buffer_.data(), buffer_.size());
            if (!read.ok()) {
                ec = boost::beast::http::error::short_read;
                return boost::none;
            }
            ec = {};
            return std::make_pair(const_buffers_type(buffer_.data(), read.value()),
                                  body_.remaining() > 0);
        }

    private:
        value_type& body_;
        std::array<char, 8192> buffer_{};
    };
};

}  // namespace harbor::http
