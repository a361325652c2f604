#include <gtest/gtest.h>

#include "phonebook/person_payload.h"

TEST(PersonPayloadTest, AcceptsNameAndNumber) {
    PersonPayload payload;
    ASSERT_EQ(parse_person_payload(R"({"name":"New Person","number":"000"})", payload), PayloadStatus::Ok);
    EXPECT_EQ(payload.name, "New Person");
    EXPECT_EQ(payload.number, "000");
}

TEST(PersonPayloadTest, IgnoresExtraFields) {
    PersonPayload payload;
    EXPECT_EQ(parse_person_payload(R"({"name":"A","number":"1","id":42})", payload), PayloadStatus::Ok);
}

TEST(PersonPayloadTest, MissingOrEmptyFieldsAreRejected) {
    PersonPayload payload;
    EXPECT_EQ(parse_person_payload("{}", payload), PayloadStatus::MissingField);
    EXPECT_EQ(parse_person_payload(R"({"name":"A"})", payload), PayloadStatus::MissingField);
    EXPECT_EQ(parse_person_payload(R"({"number":"1"})", payload), PayloadStatus::MissingField);
    EXPECT_EQ(parse_person_payload(R"({"name":"","number":"1"})", payload), PayloadStatus::MissingField);
    EXPECT_EQ(parse_person_payload(R"({"name":null,"number":"1"})", payload), PayloadStatus::MissingField);
}

TEST(PersonPayloadTest, NonStringFieldsAreRejected) {
    PersonPayload payload;
    EXPECT_EQ(parse_person_payload(R"({"name":"A","number":123})", payload), PayloadStatus::MissingField);
    EXPECT_EQ(parse_person_payload(R"({"name":true,"number":"1"})", payload), PayloadStatus::MissingField);
}

TEST(PersonPayloadTest, EmptyBodyHasNoFields) {
    PersonPayload payload;
    EXPECT_EQ(parse_person_payload("", payload), PayloadStatus::MissingField);
    EXPECT_EQ(parse_person_payload("  \r\n", payload), PayloadStatus::MissingField);
}

TEST(PersonPayloadTest, NonObjectBodyHasNoFields) {
    PersonPayload payload;
    EXPECT_EQ(parse_person_payload(R"(["name","number"])", payload), PayloadStatus::MissingField);
    EXPECT_EQ(parse_person_payload("42", payload), PayloadStatus::MissingField);
}

TEST(PersonPayloadTest, MalformedJsonIsReported) {
    PersonPayload payload;
    EXPECT_EQ(parse_person_payload(R"({"name": "A", )", payload), PayloadStatus::MalformedJson);
    EXPECT_EQ(parse_person_payload("name=A&number=1", payload), PayloadStatus::MalformedJson);
}

TEST(PersonPayloadTest, FailureLeavesOutputUntouched) {
    PersonPayload payload{"kept", "kept"};
    EXPECT_EQ(parse_person_payload(R"({"name":"A"})", payload), PayloadStatus::MissingField);
    EXPECT_EQ(payload.name, "kept");
    EXPECT_EQ(payload.number, "kept");
}
