#include <QtTest/QtTest>

#include "utils/json_parser.hpp"

using signalhub::JsonParser;

class JsonParserTests : public QObject {
    Q_OBJECT

private slots:
    void parsesTopLevelMembers();
    void keepsNestedValuesRaw();
    void decodesEscapes();
    void unpairedSurrogatesBecomeReplacementChar();
    void rejectsMalformedObjects();
    void rejectsTrailingGarbage();
    void emptyObject();
    void stringArray();
    void escapeRoundTripsThroughQt();
    void asBoolAcceptsLiteralsAndStrings();
};

void JsonParserTests::parsesTopLevelMembers() {
    JsonParser::Object obj;
    QVERIFY(JsonParser::parseObject("{\"type\":\"offer\", \"n\": 12, \"ok\":true}", obj));
    QCOMPARE(obj.size(), size_t(3));
    QVERIFY(obj["type"].is_string);
    QCOMPARE(QString::fromStdString(obj["type"].value), QString("offer"));
    QVERIFY(!obj["n"].is_string);
    QCOMPARE(QString::fromStdString(obj["n"].value), QString("12"));
    QCOMPARE(QString::fromStdString(obj["ok"].value), QString("true"));
}

void JsonParserTests::keepsNestedValuesRaw() {
    JsonParser::Object obj;
    const std::string text =
        "{\"content\":{\"sdp\":\"v=0\\r\\n\",\"list\":[1,{\"a\":null}]},\"room_id\":\"r\"}";
    QVERIFY(JsonParser::parseObject(text, obj));
    QCOMPARE(QString::fromStdString(obj["content"].value),
             QString("{\"sdp\":\"v=0\\r\\n\",\"list\":[1,{\"a\":null}]}"));

    JsonParser::Object content;
    QVERIFY(JsonParser::parseObject(obj["content"].value, content));
    QCOMPARE(QString::fromStdString(content["sdp"].value), QString("v=0\r\n"));
}

void JsonParserTests::decodesEscapes() {
    JsonParser::Object obj;
    QVERIFY(JsonParser::parseObject("{\"s\":\"a\\\"b\\\\c\\u00e9\\ud83d\\ude00\"}", obj));
    QCOMPARE(QString::fromStdString(obj["s"].value), QString::fromUtf8("a\"b\\c\xC3\xA9\xF0\x9F\x98\x80"));
}

void JsonParserTests::unpairedSurrogatesBecomeReplacementChar() {
    JsonParser::Object obj;
    QVERIFY(JsonParser::parseObject("{\"hi\":\"\\ud800x\",\"lo\":\"\\ude00\",\"pair\":\"\\ud800\\u0041\"}", obj));
    QCOMPARE(QByteArray::fromStdString(obj["hi"].value), QByteArray("\xEF\xBF\xBDx"));
    QCOMPARE(QByteArray::fromStdString(obj["lo"].value), QByteArray("\xEF\xBF\xBD"));
    QCOMPARE(QByteArray::fromStdString(obj["pair"].value), QByteArray("\xEF\xBF\xBD" "A"));
    QCOMPARE(QByteArray::fromStdString(JsonParser::unescapeJson("\\udbff!")), QByteArray("\xEF\xBF\xBD!"));
}

void JsonParserTests::rejectsMalformedObjects() {
    JsonParser::Object obj;
    QVERIFY(!JsonParser::parseObject("", obj));
    QVERIFY(!JsonParser::parseObject("[]", obj));
    QVERIFY(!JsonParser::parseObject("{\"a\":}", obj));
    QVERIFY(!JsonParser::parseObject("{\"a\":1,}", obj));
    QVERIFY(!JsonParser::parseObject("{\"a\" 1}", obj));
    QVERIFY(!JsonParser::parseObject("{\"a\":\"unterminated}", obj));
    QVERIFY(!JsonParser::parseObject("{\"a\":tru}", obj));
    QVERIFY(!JsonParser::parseObject("{\"a\":[1,2}", obj));
    QVERIFY(!JsonParser::parseObject("{a:1}", obj));
}

void JsonParserTests::rejectsTrailingGarbage() {
    JsonParser::Object obj;
    QVERIFY(!JsonParser::parseObject("{\"a\":1} x", obj));
    QVERIFY(JsonParser::parseObject("  {\"a\":1}\n", obj));
    QVERIFY(!JsonParser::isValid("1 2"));
    QVERIFY(JsonParser::isValid("-1.5e3"));
}

void JsonParserTests::emptyObject() {
    JsonParser::Object obj;
    obj["stale"] = JsonParser::Field{"x", true};
    QVERIFY(JsonParser::parseObject("{ }", obj));
    QVERIFY(obj.empty());
}

void JsonParserTests::stringArray() {
    const auto values = JsonParser::parseStringArray("[\"a\", \"b\\n\", 3, \"c\"]");
    QCOMPARE(values.size(), size_t(3));
    QCOMPARE(QString::fromStdString(values[1]), QString("b\n"));
    QVERIFY(JsonParser::parseStringArray("[\"a\"").empty());

    QCOMPARE(QString::fromStdString(JsonParser::stringArray({})), QString("[]"));
    QCOMPARE(QString::fromStdString(JsonParser::stringArray({"x", "y\"z"})), QString("[\"x\",\"y\\\"z\"]"));
}

void JsonParserTests::escapeRoundTripsThroughQt() {
    const std::string tricky = std::string("tab\tnl\nquote\"ctl") + char(0x01);
    const std::string json = "{\"v\":" + JsonParser::quote(tricky) + "}";

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &error);
    QCOMPARE(error.error, QJsonParseError::NoError);
    QCOMPARE(doc.object().value("v").toString(), QString::fromStdString(tricky));
}

void JsonParserTests::asBoolAcceptsLiteralsAndStrings() {
    bool value = false;
    QVERIFY(JsonParser::asBool(JsonParser::Field{"true", false}, value));
    QVERIFY(value);
    QVERIFY(JsonParser::asBool(JsonParser::Field{"false", true}, value));
    QVERIFY(!value);
    QVERIFY(!JsonParser::asBool(JsonParser::Field{"1", false}, value));
}

QTEST_APPLESS_MAIN(JsonParserTests)
#include "test_json_parser.moc"
