#include <drogon/drogon_test.h>
#include "../controllers/sinks/MessagesSseSink.h"

using namespace anthropic;

DROGON_TEST(Sinks_MessagesSse_EncodesEvents)
{
    std::vector<std::string> frames;
    bool closed = false;
    MessagesSseSink sink(
        [&frames](const std::string& frame) {
            frames.push_back(frame);
            return true;
        },
        [&closed]() { closed = true; });

    sink.onEvent(ContentBlockDelta{0, TextDelta{"Hi"}});
    sink.onEvent(MessageStop{});
    sink.onClose();

    REQUIRE(frames.size() == 2);
    CHECK(frames[0] ==
          "event: content_block_delta\ndata: {\"delta\":{\"text\":\"Hi\",\"type\":\"text_delta\"},\"index\":0,\"type\":\"content_block_delta\"}\n\n");
    CHECK(frames[1] == "event: message_stop\ndata: {\"type\":\"message_stop\"}\n\n");
    CHECK(closed);
    CHECK(!sink.isValid());
    CHECK(sink.sentEvents() == 2);
}

DROGON_TEST(Sinks_MessagesSse_ErrorEvent)
{
    std::string frame;
    MessagesSseSink sink(
        [&frame](const std::string& f) {
            frame = f;
            return true;
        },
        nullptr);
    sink.onEvent(StreamError{"api_error", "backend down"});
    CHECK(frame.rfind("event: error\n", 0) == 0);
    CHECK(frame.find("\"message\":\"backend down\"") != std::string::npos);
    CHECK(frame.find("\"type\":\"api_error\"") != std::string::npos);
}

DROGON_TEST(Sinks_MessagesSse_DisconnectStopsSending)
{
    int attempts = 0;
    MessagesSseSink sink(
        [&attempts](const std::string&) {
            ++attempts;
            return attempts < 2;
        },
        nullptr);

    sink.onEvent(MessageStop{});
    CHECK(sink.isValid());
    sink.onEvent(MessageStop{});
    CHECK(!sink.isValid());
    sink.onEvent(MessageStop{});
    CHECK(attempts == 2);
    CHECK(sink.sentEvents() == 1);
}

DROGON_TEST(Sinks_CollectorSink)
{
    CollectorSink sink;
    sink.onEvent(MessageStart{"msg_1", "m", Usage{}});
    sink.onEvent(StreamError{"api_error", "x"});
    sink.onClose();
    CHECK(sink.hasError());
    CHECK(sink.isClosed());
    REQUIRE(sink.getEventNames().size() == 2);
    CHECK(sink.getEventNames()[1] == "error");
}
