#include <catch2/catch_test_macros.hpp>
#include "sync/validation_gate.hpp"
#include "core/codec.hpp"

#include <QJsonArray>

using namespace atelier;
using namespace atelier::sync;

TEST_CASE("Inline binary detection", "[validation]") {
    REQUIRE(is_inline_binary(u"data:image/png;base64,iVBORw0"));
    REQUIRE(is_inline_binary(u"DATA:image/jpeg;base64,/9j/"));
    REQUIRE_FALSE(is_inline_binary(u"https://cdn.example/a.png"));
    REQUIRE_FALSE(is_inline_binary(u"metadata:"));
}

TEST_CASE("Inline binary path is reported", "[validation]") {
    QJsonObject payload{
        {"generatedModelHistory", QJsonArray{
            QJsonObject{{"imageUrl", "https://cdn.example/ok.png"}},
            QJsonObject{{"imageUrl", "data:image/png;base64,AAAA"}},
        }},
    };
    REQUIRE(find_inline_binary(payload) == std::string("$.generatedModelHistory[1].imageUrl"));
    REQUIRE_FALSE(find_inline_binary(QJsonObject{{"title", "Resort"}}).has_value());
}

TEST_CASE("ValidationGate payload checks", "[validation]") {
    const ValidationGate gate(256);

    SECTION("Clean payload passes") {
        REQUIRE(gate.validate(QJsonObject{{"title", "Resort"}}).is_ok());
    }

    SECTION("Nested inline image is rejected") {
        QJsonObject payload{{"stylingHistory", QJsonObject{
            {"gen-1", QJsonArray{QJsonObject{{"imageUrl", "data:image/webp;base64,UklG"}}}}}}};
        auto result = gate.validate(payload);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorCode::ValidationRejected));
        REQUIRE(result.unwrap_err().message.find("$.stylingHistory.gen-1[0].imageUrl") != std::string::npos);
    }

    SECTION("Oversized payload is rejected") {
        QJsonObject payload{{"modelDescription", QString(300, QLatin1Char('x'))}};
        auto result = gate.validate(payload);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorCode::ValidationRejected));
        REQUIRE(result.unwrap_err().message.find("limit is 256") != std::string::npos);
    }

    SECTION("Inline check ignores size") {
        QJsonObject large{{"modelDescription", QString(300, QLatin1Char('x'))}};
        REQUIRE(ValidationGate::check_inline(large).is_ok());
        large.insert(QStringLiteral("imageUrl"), QStringLiteral("data:image/png;base64,AA"));
        REQUIRE(ValidationGate::check_inline(large).unwrap_err().is(ErrorCode::ValidationRejected));
    }
}

TEST_CASE("ValidationGate batch checks name the document", "[validation]") {
    const ValidationGate gate;
    network::WriteBatch batch;
    batch.set("projects/p1", QJsonObject{{"title", "ok"}});
    batch.remove("projects/p1/history/gone");
    REQUIRE(gate.validate(batch).is_ok());

    batch.set("projects/p1/history/gen-1", QJsonObject{{"imageUrl", "data:image/png;base64,AA"}},
              network::WriteMode::Replace);
    auto result = gate.validate(batch);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message.rfind("projects/p1/history/gen-1: ", 0) == 0);
}

TEST_CASE("History items need an id and an image", "[validation]") {
    auto item = create_root_item("gen-1", HistoryItemType::ModelGeneration, "https://cdn.example/a.png");
    REQUIRE(ValidationGate::check_history_item(item).is_ok());

    item.image_url.clear();
    REQUIRE(ValidationGate::check_history_item(item).unwrap_err().is(ErrorCode::MalformedEntity));

    item.image_url = "https://cdn.example/a.png";
    item.id.clear();
    REQUIRE(ValidationGate::check_history_item(item).is_err());
}
