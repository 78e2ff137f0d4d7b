#include "ledgit/events/event_sink.hpp"
#include <doctest/doctest.h>

using namespace ledgit;

TEST_SUITE("Event Tests") {

    TEST_CASE("Event fields") {
        Event event(EventType::BlockEvolved, "EvolvingRegistry", 42);
        event.withNumber("block_id", 7).with("owner", "0xabc").withFlag("active", true);

        CHECK(event.getType() == EventType::BlockEvolved);
        CHECK(event.getContract() == "EvolvingRegistry");
        CHECK(event.timestamp == 42);
        CHECK(event.get("block_id") == "7");
        CHECK(event.get("owner") == "0xabc");
        CHECK(event.get("active") == "true");
        CHECK(event.has("owner"));
        CHECK_FALSE(event.has("missing"));
        CHECK(event.get("missing") == "");
    }

    TEST_CASE("Event type names") {
        CHECK(eventTypeToString(EventType::OwnershipTransferred) == "OwnershipTransferred");
        CHECK(eventTypeToString(EventType::BlocksMerged) == "BlocksMerged");
        CHECK(eventTypeToString(EventType::Approval) == "Approval");
    }

    TEST_CASE("JSON rendering keeps field order") {
        Event event(EventType::Transfer, "TokenLedger", 5);
        event.with("from", "0x1").with("to", "0x2").withNumber("value", 10);

        CHECK(event.toJson() == "{\"event\":\"Transfer\",\"contract\":\"TokenLedger\",\"timestamp\":5,"
                                "\"from\":\"0x1\",\"to\":\"0x2\",\"value\":\"10\"}");
    }

    TEST_CASE("JSON rendering escapes field text") {
        Event event(EventType::ContentCreated, "ContentRegistry", 1);
        event.with("label", "say \"hi\"").with("uri", "C:\\docs").with("tag", std::string("a\nb\x01"));

        auto json = event.toJson();
        CHECK(json.find(R"("label":"say \"hi\"")") != std::string::npos);
        CHECK(json.find(R"("uri":"C:\\docs")") != std::string::npos);
        CHECK(json.find(R"("tag":"a\nb\u0001")") != std::string::npos);
        CHECK(json.find('\n') == std::string::npos);
    }

    TEST_CASE("Memory sink records events in order") {
        MemoryEventSink sink;
        CHECK(sink.size() == 0);
        CHECK(sink.last().fields.empty());

        sink.publish(Event(EventType::Transfer, "TokenLedger", 1));
        sink.publish(Event(EventType::Approval, "TokenLedger", 2));
        sink.publish(Event(EventType::Transfer, "TokenLedger", 3));

        CHECK(sink.size() == 3);
        CHECK(sink.last().timestamp == 3);
        auto transfers = sink.eventsOfType(EventType::Transfer);
        REQUIRE(transfers.size() == 2);
        CHECK(transfers[0].timestamp == 1);
        CHECK(transfers[1].timestamp == 3);

        sink.clear();
        CHECK(sink.size() == 0);
    }

    TEST_CASE("Fanout sink forwards to every sink") {
        auto first = std::make_shared<MemoryEventSink>();
        auto second = std::make_shared<MemoryEventSink>();
        FanoutEventSink fanout;
        fanout.addSink(first);
        fanout.addSink(second);
        fanout.addSink(nullptr);
        CHECK(fanout.sinkCount() == 2);

        fanout.publish(Event(EventType::BlockCreated, "EvolvingRegistry", 9));
        CHECK(first->size() == 1);
        CHECK(second->size() == 1);
        CHECK(second->last().getType() == EventType::BlockCreated);
    }
}
