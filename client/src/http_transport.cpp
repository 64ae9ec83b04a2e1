#include "resupload/client/http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace resupload::client
{

    namespace
    {

        namespace net = boost::asio;
        namespace beast = boost::beast;
        namespace beast_http = beast::http;
        using tcp = net::ip::tcp;
        using error_code = boost::system::error_code;

        using RequestMessage = beast_http::request<beast_http::vector_body<std::byte>>;
        using ResponseParser = beast_http::response_parser<beast_http::string_body>;

        std::string host_field(const http::Url &url)
        {
            const bool ipv6 = url.host.find(':') != std::string::npos;
            auto host = ipv6 ? "[" + url.host + "]" : url.host;
            const std::uint16_t default_port = url.secure() ? 443 : 80;
            if (url.port != default_port)
            {
                host += ':';
                host += std::to_string(url.port);
            }
            return host;
        }

        RequestMessage to_message(http::Request &request)
        {
            RequestMessage message;
            message.version(11);
            const auto verb = beast_http::string_to_verb(request.method);
            if (verb == beast_http::verb::unknown)
            {
                message.method_string(request.method);
            }
            else
            {
                message.method(verb);
            }
            message.target(request.url.target);
            message.set(beast_http::field::host, host_field(request.url));
            for (const auto &[name, value] : request.headers)
            {
                if (http::iequals(name, "Content-Length") || http::iequals(name, "Transfer-Encoding") ||
                    http::iequals(name, "Connection"))
                {
                    continue;
                }
                message.set(name, value);
            }
            message.keep_alive(false);
            message.body() = std::move(request.body);
            message.prepare_payload();
            return message;
        }

        // One request on its own connection. Stream is beast::tcp_stream or an ssl_stream over it.
        template <typename Stream>
        class Exchange : public std::enable_shared_from_this<Exchange<Stream>>
        {
        public:
            static constexpr bool kSecure = !std::is_same_v<Stream, beast::tcp_stream>;

            template <typename... StreamArgs>
            Exchange(net::io_context &io_context, std::chrono::milliseconds timeout, http::Request request,
                     CancellationToken token, Transport::Handler handler, StreamArgs &&...stream_args)
                : io_context_(io_context),
                  resolver_(io_context),
                  stream_(std::forward<StreamArgs>(stream_args)...),
                  timer_(io_context),
                  timeout_(timeout),
                  url_(request.url),
                  head_only_(request.method == "HEAD"),
                  message_(to_message(request)),
                  token_(std::move(token)),
                  handler_(std::move(handler))
            {
            }

            void start()
            {
                auto self = this->shared_from_this();
                if (token_.cancelled())
                {
                    net::post(io_context_, [self]
                              { self->finish(net::error::operation_aborted); });
                    return;
                }

                std::weak_ptr<Exchange> weak = self;
                auto &io_context = io_context_;
                subscription_ = token_.subscribe([weak, &io_context]
                                                 { net::post(io_context, [weak]
                                                             {
                    if (auto exchange = weak.lock())
                    {
                        exchange->abort(net::error::operation_aborted);
                    } }); });

                if (timeout_.count() > 0)
                {
                    timer_.expires_after(timeout_);
                    timer_.async_wait([self](const error_code &ec)
                                      {
                        if (!ec)
                        {
                            self->abort(net::error::timed_out);
                        } });
                }

                resolver_.async_resolve(url_.host, std::to_string(url_.port),
                                        [this, self](const error_code &ec, const tcp::resolver::results_type &results)
                                        {
                                            if (ec)
                                            {
                                                finish(ec);
                                                return;
                                            }
                                            connect(results);
                                        });
            }

        private:
            void connect(const tcp::resolver::results_type &results)
            {
                auto self = this->shared_from_this();
                beast::get_lowest_layer(stream_).async_connect(
                    results, [this, self](const error_code &ec, const tcp::endpoint & /*endpoint*/)
                    {
                        if (ec)
                        {
                            finish(ec);
                            return;
                        }
                        handshake();
                    });
            }

            void handshake()
            {
                if constexpr (kSecure)
                {
                    if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str()))
                    {
                        finish(error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
                        return;
                    }
                    stream_.set_verify_callback(net::ssl::host_name_verification(url_.host));
                    auto self = this->shared_from_this();
                    stream_.async_handshake(net::ssl::stream_base::client, [this, self](const error_code &ec)
                                            {
                        if (ec)
                        {
                            finish(ec);
                            return;
                        }
                        transmit(); });
                }
                else
                {
                    transmit();
                }
            }

            // The read runs alongside the write: a peer may answer and close before the body is drained.
            void transmit()
            {
                parser_.body_limit(HttpTransport::kMaxResponseBody);
                parser_.skip(head_only_);

                auto self = this->shared_from_this();
                beast_http::async_read(stream_, buffer_, parser_,
                                       [this, self](const error_code &ec, std::size_t /*bytes_transferred*/)
                                       { on_read(ec); });
                beast_http::async_write(stream_, message_,
                                        [this, self](const error_code &ec, std::size_t /*bytes_transferred*/)
                                        {
                                            if (ec)
                                            {
                                                // Reported only if the pending read yields no response.
                                                write_error_ = ec;
                                            }
                                        });
            }

            void on_read(const error_code &ec)
            {
                if (ec)
                {
                    finish(write_error_ ? write_error_ : ec);
                    return;
                }
                auto &message = parser_.get();
                response_.status = message.result_int();
                const auto reason = message.reason();
                response_.reason.assign(reason.data(), reason.size());
                for (const auto &field : message)
                {
                    const auto name = field.name_string();
                    const auto value = field.value();
                    response_.headers.emplace_back(std::string(name.data(), name.size()),
                                                   std::string(value.data(), value.size()));
                }
                response_.body = std::move(message.body());
                finish({});
            }

            // Closing the socket makes the pending operations complete; finish() then reports `reason`.
            void abort(const error_code &reason)
            {
                if (done_)
                {
                    return;
                }
                failure_ = reason;
                resolver_.cancel();
                beast::get_lowest_layer(stream_).close();
            }

            void finish(error_code ec)
            {
                if (done_)
                {
                    return;
                }
                done_ = true;
                if (failure_)
                {
                    ec = failure_;
                }

                timer_.cancel();
                token_.unsubscribe(subscription_);
                beast::get_lowest_layer(stream_).close();

                auto handler = std::move(handler_);
                handler(ec, ec ? http::Response{} : std::move(response_));
            }

            net::io_context &io_context_;
            tcp::resolver resolver_;
            Stream stream_;
            net::steady_timer timer_;
            std::chrono::milliseconds timeout_;
            http::Url url_;
            bool head_only_;
            RequestMessage message_;
            CancellationToken token_;
            Transport::Handler handler_;
            std::size_t subscription_{};
            beast::flat_buffer buffer_;
            ResponseParser parser_;
            http::Response response_;
            error_code write_error_;
            error_code failure_;
            bool done_{false};
        };

        template <typename Stream, typename... StreamArgs>
        void launch(net::io_context &io_context, std::chrono::milliseconds timeout, http::Request request,
                    CancellationToken token, Transport::Handler handler, StreamArgs &&...stream_args)
        {
            auto exchange = std::make_shared<Exchange<Stream>>(io_context, timeout, std::move(request), std::move(token),
                                                               std::move(handler),
                                                               std::forward<StreamArgs>(stream_args)...);
            exchange->start();
        }

    } // namespace

    HttpTransport::HttpTransport(boost::asio::io_context &io_context, std::chrono::milliseconds timeout)
        : io_context_(io_context), timeout_(timeout), tls_(boost::asio::ssl::context::tls_client)
    {
        tls_.set_default_verify_paths();
        tls_.set_verify_mode(boost::asio::ssl::verify_peer);
    }

    void HttpTransport::async_send(http::Request request, CancellationToken token, Handler handler)
    {
        if (request.url.secure())
        {
            launch<beast::ssl_stream<beast::tcp_stream>>(io_context_, timeout_, std::move(request), std::move(token),
                                                         std::move(handler), io_context_, tls_);
            return;
        }
        launch<beast::tcp_stream>(io_context_, timeout_, std::move(request), std::move(token), std::move(handler),
                                  io_context_);
    }

} // namespace resupload::client
