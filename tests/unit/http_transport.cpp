#include <cassert>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

#include "resupload/client/cancellation.hpp"
#include "resupload/client/http_transport.hpp"
#include "resupload/http.hpp"

using namespace resupload;
using namespace resupload::client;
using namespace std::chrono_literals;
namespace net = boost::asio;
using net::ip::tcp;
using error_code = boost::system::error_code;

namespace
{

    enum class Answer
    {
        AfterBody,
        // Reply as soon as the head arrived and close without draining the body.
        BeforeBody
    };

    // Accepts a single connection on 127.0.0.1, records the request and answers with a canned response.
    class LoopbackServer
    {
    public:
        LoopbackServer(net::io_context &io_context, std::optional<std::string> response, Answer answer = Answer::AfterBody)
            : acceptor_(io_context, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
              response_(std::move(response)),
              answer_(answer)
        {
            accept();
        }

        std::uint16_t port() const
        {
            return acceptor_.local_endpoint().port();
        }

        std::string url(const std::string &target = "/upload") const
        {
            return "http://127.0.0.1:" + std::to_string(port()) + target;
        }

        void stop()
        {
            error_code ignored;
            acceptor_.close(ignored);
        }

        bool accepted{false};
        std::string received_head;
        std::string received_body;

    private:
        void accept()
        {
            acceptor_.async_accept([this](const error_code &ec, tcp::socket socket)
                                   {
                if (ec)
                {
                    return;
                }
                accepted = true;
                socket_ = std::make_shared<tcp::socket>(std::move(socket));
                read_head(); });
        }

        void read_head()
        {
            net::async_read_until(*socket_, net::dynamic_buffer(buffer_), "\r\n\r\n",
                                  [this](const error_code &ec, std::size_t bytes)
                                  {
                                      if (ec)
                                      {
                                          return;
                                      }
                                      received_head = buffer_.substr(0, bytes);
                                      buffer_.erase(0, bytes);
                                      if (answer_ == Answer::BeforeBody)
                                      {
                                          respond();
                                          return;
                                      }
                                      read_body(request_length());
                                  });
        }

        std::size_t request_length() const
        {
            constexpr std::string_view kHeader = "Content-Length: ";
            const auto position = received_head.find(kHeader);
            if (position == std::string::npos)
            {
                return 0;
            }
            return std::stoul(received_head.substr(position + kHeader.size()));
        }

        void read_body(std::size_t length)
        {
            if (buffer_.size() >= length)
            {
                received_body = buffer_.substr(0, length);
                respond();
                return;
            }
            net::async_read(*socket_, net::dynamic_buffer(buffer_), net::transfer_exactly(length - buffer_.size()),
                            [this, length](const error_code &ec, std::size_t /*bytes*/)
                            {
                                if (ec)
                                {
                                    return;
                                }
                                read_body(length);
                            });
        }

        void respond()
        {
            if (!response_)
            {
                // Hold the connection open without answering.
                return;
            }
            net::async_write(*socket_, net::buffer(*response_),
                             [socket = socket_](const error_code & /*ec*/, std::size_t /*bytes*/)
                             {
                                 error_code ignored;
                                 socket->close(ignored);
                             });
        }

        tcp::acceptor acceptor_;
        std::optional<std::string> response_;
        Answer answer_;
        std::shared_ptr<tcp::socket> socket_;
        std::string buffer_;
    };

    struct Outcome
    {
        bool called{false};
        error_code error;
        http::Response response;
    };

    http::Request make_request(const std::string &url, const std::string &body)
    {
        http::Request request;
        request.method = "PUT";
        request.url = http::parse_url(url);
        request.headers = {{"Content-Range", "bytes 0-" + std::to_string(body.size() - 1) + "/100"},
                           {"Upload-Id", "abc"}};
        for (const char ch : body)
        {
            request.body.push_back(static_cast<std::byte>(ch));
        }
        return request;
    }

    Outcome exchange(const std::optional<std::string> &response, std::chrono::milliseconds timeout)
    {
        net::io_context io_context;
        LoopbackServer server(io_context, response);
        HttpTransport transport(io_context, timeout);

        Outcome outcome;
        transport.async_send(make_request(server.url(), "hello world"), CancellationToken{},
                             [&outcome](const error_code &ec, http::Response result)
                             {
                                 assert(!outcome.called);
                                 outcome.called = true;
                                 outcome.error = ec;
                                 outcome.response = std::move(result);
                             });
        io_context.run();

        assert(outcome.called);
        if (!outcome.error)
        {
            assert(server.received_head.rfind("PUT /upload HTTP/1.1\r\n", 0) == 0);
            assert(server.received_head.find("Content-Range: bytes 0-10/100\r\n") != std::string::npos);
            assert(server.received_head.find("Upload-Id: abc\r\n") != std::string::npos);
            assert(server.received_head.find("Connection: close\r\n") != std::string::npos);
            assert(server.received_head.find("Content-Length: 11\r\n") != std::string::npos);
            assert(server.received_body == "hello world");
        }
        return outcome;
    }

    void test_content_length_response()
    {
        const auto outcome = exchange(std::string("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"), 2000ms);
        assert(!outcome.error);
        assert(outcome.response.status == 200);
        assert(outcome.response.reason == "OK");
        assert(outcome.response.body == "ok");
        assert(http::find_header(outcome.response.headers, "content-length") == std::optional<std::string>("2"));
    }

    void test_chunked_response()
    {
        const auto outcome = exchange(
            std::string("HTTP/1.1 201 Created\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n"),
            2000ms);
        assert(!outcome.error);
        assert(outcome.response.status == 201);
        assert(outcome.response.body == "abcde");
    }

    void test_malformed_chunk_size_is_a_transport_error()
    {
        const auto outcome =
            exchange(std::string("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"), 2000ms);
        assert(outcome.called);
        assert(outcome.error);
        assert(outcome.response.status == 0);
    }

    void test_close_delimited_response()
    {
        const auto outcome = exchange(std::string("HTTP/1.1 200 OK\r\n\r\n{\"upload_id\":\"x\"}"), 2000ms);
        assert(!outcome.error);
        assert(outcome.response.body == "{\"upload_id\":\"x\"}");
    }

    void test_rejection_status_is_not_an_error()
    {
        const auto outcome = exchange(std::string("HTTP/1.1 413 Payload Too Large\r\nContent-Length: 0\r\n\r\n"), 2000ms);
        assert(!outcome.error);
        assert(outcome.response.status == http::kStatusPayloadTooLarge);
        assert(outcome.response.body.empty());
    }

    void test_rejection_before_body_is_drained()
    {
        net::io_context io_context;
        LoopbackServer server(io_context,
                              std::string("HTTP/1.1 413 Payload Too Large\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"),
                              Answer::BeforeBody);
        HttpTransport transport(io_context, 5000ms);

        auto request = make_request(server.url(), "x");
        request.body.assign(8 * 1024 * 1024, std::byte{'a'});

        Outcome outcome;
        transport.async_send(std::move(request), CancellationToken{},
                             [&outcome](const error_code &ec, http::Response result)
                             {
                                 outcome.called = true;
                                 outcome.error = ec;
                                 outcome.response = std::move(result);
                             });
        io_context.run();

        assert(outcome.called);
        assert(!outcome.error);
        assert(outcome.response.status == http::kStatusPayloadTooLarge);
        assert(server.received_body.empty());
    }

    void test_oversized_response_body_is_rejected()
    {
        std::string response = "HTTP/1.1 200 OK\r\nContent-Length: " +
                               std::to_string(HttpTransport::kMaxResponseBody + 1) + "\r\n\r\n";
        response.append(HttpTransport::kMaxResponseBody + 1, 'x');
        const auto outcome = ::exchange(response, 2000ms);
        assert(outcome.error);
    }

    void test_malformed_response()
    {
        const auto outcome = exchange(std::string("garbage\r\n\r\n"), 2000ms);
        assert(outcome.error);
    }

    void test_timeout()
    {
        const auto outcome = ::exchange(std::nullopt, 100ms);
        assert(outcome.error == net::error::timed_out);
    }

    void test_cancellation_aborts_request()
    {
        net::io_context io_context;
        LoopbackServer server(io_context, std::nullopt);
        HttpTransport transport(io_context, 0ms);
        CancellationSource source;

        std::optional<error_code> result;
        transport.async_send(make_request(server.url(), "payload"), source.token(),
                             [&result](const error_code &ec, http::Response)
                             { result = ec; });

        net::steady_timer timer(io_context, 50ms);
        timer.async_wait([&source](const error_code &)
                         { source.cancel(); });
        io_context.run();

        assert(result);
        assert(*result == net::error::operation_aborted);
        assert(server.accepted);
    }

    void test_cancelled_before_send()
    {
        net::io_context io_context;
        LoopbackServer server(io_context, std::string("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"));
        HttpTransport transport(io_context, 0ms);
        CancellationSource source;
        source.cancel();

        std::optional<error_code> result;
        transport.async_send(make_request(server.url(), "payload"), source.token(),
                             [&result](const error_code &ec, http::Response)
                             { result = ec; });
        net::steady_timer timer(io_context, 50ms);
        timer.async_wait([&server](const error_code &)
                         { server.stop(); });
        io_context.run();

        assert(result);
        assert(*result == net::error::operation_aborted);
        assert(!server.accepted);
    }

    void test_connection_refused()
    {
        net::io_context io_context;
        std::uint16_t port = 0;
        {
            tcp::acceptor reserved(io_context, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
            port = reserved.local_endpoint().port();
        }
        HttpTransport transport(io_context, 2000ms);

        std::optional<error_code> result;
        transport.async_send(make_request("http://127.0.0.1:" + std::to_string(port) + "/upload", "x"),
                             CancellationToken{}, [&result](const error_code &ec, http::Response)
                             { result = ec; });
        io_context.run();

        assert(result);
        assert(*result);
    }

} // namespace

void run_http_transport_tests()
{
    test_content_length_response();
    test_chunked_response();
    test_malformed_chunk_size_is_a_transport_error();
    test_close_delimited_response();
    test_rejection_status_is_not_an_error();
    test_rejection_before_body_is_drained();
    test_oversized_response_body_is_rejected();
    test_malformed_response();
    test_timeout();
    test_cancellation_aborts_request();
    test_cancelled_before_send();
    test_connection_refused();
}
