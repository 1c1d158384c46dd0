#include "cifra/escalation_json.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace cifra;
using json = nlohmann::json;

namespace {

RawFieldCandidate field(int table_id, const std::string& field_id, std::vector<std::string> contents) {
    RawFieldCandidate candidate;
    candidate.table_id = table_id;
    candidate.field_id = field_id;
    candidate.contents = std::move(contents);
    return candidate;
}

} // namespace

TEST(EscalationRequestTest, GroupsFieldsPerTable) {
    EscalationBatch batch;
    batch[2].push_back(field(2, "02", {"sinc", "85"}));
    batch[1].push_back(field(1, "96", {"xqzwvkj", "25"}));
    batch[1].push_back(field(1, "97", {}));

    json request = json::parse(escalation_request_json(batch));
    ASSERT_TRUE(request["tables"].is_array());
    ASSERT_EQ(request["tables"].size(), 2u);

    const json& first = request["tables"][0];
    EXPECT_EQ(first["table_id"], 1);
    ASSERT_EQ(first["fields"].size(), 2u);
    EXPECT_EQ(first["fields"][0]["id"], "96");
    EXPECT_EQ(first["fields"][0]["contents"], json::array({"xqzwvkj", "25"}));
    EXPECT_TRUE(first["fields"][1]["contents"].empty());

    EXPECT_EQ(request["tables"][1]["table_id"], 2);
    EXPECT_EQ(request["tables"][1]["fields"][0]["id"], "02");
}

TEST(EscalationRequestTest, InvalidUtf8IsReplaced) {
    EscalationBatch batch;
    batch[1].push_back(field(1, "9\xff", {"zzqq\xff\xfe", "47"}));

    std::string text;
    ASSERT_NO_THROW(text = escalation_request_json(batch));
    json request = json::parse(text);
    EXPECT_EQ(request["tables"][0]["fields"][0]["id"], "9\xEF\xBF\xBD");
    EXPECT_EQ(request["tables"][0]["fields"][0]["contents"][1], "47");
}

TEST(EscalationResponseTest, PerTableShape) {
    EscalationResponse response = parse_escalation_response(R"({
        "resultados_por_tabla": {
            "1": [{"id": "96", "valor": 25, "razonamiento": "digits and text agree", "confianza": "alta"}],
            "10": [{"id": 4, "valor": 7.0, "confianza": "Media"}]
        }
    })");

    ASSERT_EQ(response.size(), 2u);
    ASSERT_EQ(response[1].size(), 1u);
    const ExternalVerdict& verdict = response[1][0];
    EXPECT_EQ(verdict.table_id, 1);
    EXPECT_EQ(verdict.field_id, "96");
    EXPECT_EQ(verdict.value, 25);
    EXPECT_EQ(verdict.label, ConfidenceLabel::Alta);
    EXPECT_EQ(verdict.rationale, "digits and text agree");

    ASSERT_EQ(response[10].size(), 1u);
    EXPECT_EQ(response[10][0].field_id, "4");
    EXPECT_EQ(response[10][0].value, 7);
    EXPECT_EQ(response[10][0].label, ConfidenceLabel::Media);
}

TEST(EscalationResponseTest, FlatShape) {
    EscalationResponse response = parse_escalation_response(R"({
        "resultados": [
            {"tabla": 2, "id": "02", "valor": 5, "confianza": "baja"},
            {"tabla": 1, "id": "96", "valor": null},
            {"tabla": 2, "id": "03", "confianza": "whatever"}
        ]
    })");

    ASSERT_EQ(response.size(), 2u);
    ASSERT_EQ(response[2].size(), 2u);
    EXPECT_EQ(response[2][0].value, 5);
    EXPECT_EQ(response[2][0].label, ConfidenceLabel::Baja);
    EXPECT_FALSE(response[2][1].value.has_value());
    EXPECT_EQ(response[2][1].label, ConfidenceLabel::Unknown);
    EXPECT_FALSE(response[1][0].value.has_value());
}

TEST(EscalationResponseTest, EmptyAnswerIsValid) {
    EXPECT_TRUE(parse_escalation_response(R"({"resultados_por_tabla": {}})").empty());
    EXPECT_TRUE(parse_escalation_response(R"({"resultados": []})").empty());
}

TEST(EscalationResponseTest, ExtremeValuesAreClamped) {
    EscalationResponse response = parse_escalation_response(
        R"({"resultados": [{"tabla": 1, "id": "a", "valor": 99999999999}, {"tabla": 1, "id": "b", "valor": -40}]})");
    EXPECT_EQ(response[1][0].value, 1000000);
    EXPECT_EQ(response[1][1].value, -1);
}

TEST(EscalationResponseTest, RejectsMalformedAnswers) {
    EXPECT_THROW(parse_escalation_response("not json at all"), EscalationError);
    EXPECT_THROW(parse_escalation_response("[1, 2, 3]"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"answers": []})"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados_por_tabla": []})"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados_por_tabla": {"uno": []}})"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados_por_tabla": {"1": {"id": "2"}}})"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados_por_tabla": {"1": [{"valor": 2}]}})"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados_por_tabla": {"1": [{"id": "2", "valor": "dos"}]}})"),
                 EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados_por_tabla": {"1": [{"id": "2", "valor": 2.5}]}})"),
                 EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados": [{"id": "2", "valor": 2}]})"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados": [{"tabla": 4294967297, "id": "2"}]})"), EscalationError);
    EXPECT_THROW(parse_escalation_response(R"({"resultados": [{"tabla": -4294967297, "id": "2"}]})"), EscalationError);
}

TEST(JsonBatchValidatorTest, SendsRequestAndParsesAnswer) {
    std::string seen_request;
    std::chrono::milliseconds seen_timeout{0};
    JsonBatchValidator validator([&](const std::string& request, const EscalationContext& context) {
        seen_request = request;
        seen_timeout = context.timeout;
        return std::string(R"({"resultados_por_tabla": {"1": [{"id": "96", "valor": 25, "confianza": "alta"}]}})");
    });

    EscalationBatch batch;
    batch[1].push_back(field(1, "96", {"xqzwvkj", "25"}));
    EscalationContext context;
    context.timeout = std::chrono::milliseconds(250);

    EscalationResponse response = validator.validate(batch, context);
    EXPECT_EQ(seen_request, escalation_request_json(batch));
    EXPECT_EQ(seen_timeout, std::chrono::milliseconds(250));
    ASSERT_EQ(response[1].size(), 1u);
    EXPECT_EQ(response[1][0].value, 25);
}

TEST(JsonBatchValidatorTest, MissingTransportThrows) {
    JsonBatchValidator validator(nullptr);
    EXPECT_THROW(validator.validate(EscalationBatch(), EscalationContext()), EscalationError);
}
