#include "message.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  {
    auto const input = "From: Joe SixPack <joe@football.example.com>\r\n"
                       "Subject: Is dinner\r\n"
                       "\tready?\r\n"
                       "DKIM-Signature : v=1\r\n"
                       "\r\n"
                       "Hi.\r\n"
                       "\r\n"
                       "Joe.\r\n";
    message::parsed msg;
    CHECK(msg.parse(input));
    CHECK_EQ(msg.headers.size(), 3u);

    CHECK_EQ(msg.headers[0].name, "From");
    CHECK_EQ(msg.headers[0].value, " Joe SixPack <joe@football.example.com>");
    CHECK_EQ(msg.headers[0].as_view(),
             "From: Joe SixPack <joe@football.example.com>");

    // Folding is kept as received.
    CHECK_EQ(msg.headers[1].value, " Is dinner\r\n\tready?");
    CHECK_EQ(msg.headers[1].as_view(), "Subject: Is dinner\r\n\tready?");

    // White space before the colon stays in the field, not the name.
    CHECK_EQ(msg.headers[2].name, "DKIM-Signature");
    CHECK_EQ(msg.headers[2].as_view(), "DKIM-Signature : v=1");
    CHECK(msg.headers[2] == message::DKIM_Signature);
    CHECK(msg.headers[2] == "dkim-signature");

    CHECK_EQ(msg.body, "Hi.\r\n\r\nJoe.\r\n");

    CHECK_EQ(msg.get_header("subject"), "Is dinner\r\n\tready?");
    CHECK_EQ(msg.get_header("To"), "");

    CHECK_EQ(msg.as_string(), input);
  }

  {
    // Bare LF line endings, repeated names.
    auto const input = "Received: one\n"
                       "To: x@example.com\n"
                       "Received: two\n"
                       "  continued\n"
                       "\n"
                       "body\n";
    message::parsed msg;
    CHECK(msg.parse(input));
    CHECK_EQ(msg.headers.size(), 3u);
    auto const rcvd = msg.find_all("received");
    CHECK_EQ(rcvd.size(), 2u);
    CHECK_EQ(rcvd[0], 0u);
    CHECK_EQ(rcvd[1], 2u);
    CHECK_EQ(msg.headers[2].value, " two\n  continued");
    CHECK_EQ(msg.body, "body\n");
  }

  {
    // Header block only, no separator line.
    message::parsed msg;
    CHECK(msg.parse("From: a@example.com\r\nTo: b@example.com"));
    CHECK_EQ(msg.headers.size(), 2u);
    CHECK(msg.body.empty());
  }

  {
    // Empty body after the separator.
    message::parsed msg;
    CHECK(msg.parse("From: a@example.com\r\n\r\n"));
    CHECK_EQ(msg.headers.size(), 1u);
    CHECK(msg.body.empty());
  }

  {
    message::parsed msg;
    CHECK(!msg.parse("not a header line\r\n\r\nbody"));
  }
}
