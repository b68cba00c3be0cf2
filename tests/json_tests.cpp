#include <cstdlib>
#include <iostream>
#include <sandpit/json/json.h>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static sandpit::json::Json parse_ok(const std::string& text)
{
    auto parsed = sandpit::json::parse_json(text);
    if (!parsed.has_value())
    {
        fail("expected JSON to parse: " + text);
    }
    return *parsed;
}

static void expect_reject(const std::string& text)
{
    if (sandpit::json::parse_json(text).has_value())
    {
        fail("expected JSON to be rejected: " + text);
    }
}

int main()
{
    using sandpit::json::Json;

    {
        const auto j = parse_ok(R"( {"a": [1, 2.5, true, null], "b": {"c": "d"}} )");
        const auto* obj = j.as_object();
        if (obj == nullptr || obj->size() != 2)
        {
            fail("expected object with two members");
        }
        const auto* arr = obj->at("a").as_array();
        if (arr == nullptr || arr->size() != 4 || !(*arr)[3].is_null() || *(*arr)[1].as_number() != 2.5)
        {
            fail("array contents");
        }
        const auto inner = sandpit::json::get_object(*obj, "b");
        if (!inner.has_value() || sandpit::json::get_string(*inner->as_object(), "c") != "d")
        {
            fail("nested object lookup");
        }
    }

    {
        const auto j = parse_ok(R"("tab\t quote\" slash\/ e\u00e9 smile\ud83d\ude00")");
        if (*j.as_string() != "tab\t quote\" slash/ e\xC3\xA9 smile\xF0\x9F\x98\x80")
        {
            fail("string escapes decode");
        }
    }

    expect_reject("");
    expect_reject("{");
    expect_reject("[1, 2,]");
    expect_reject("{\"a\": 1} trailing");
    expect_reject("01");
    expect_reject("1.");
    expect_reject("'single'");
    expect_reject("\"unterminated");
    expect_reject("\"\\ud83d\"");
    expect_reject(std::string(100, '[') + std::string(100, ']'));

    {
        Json::Object obj;
        obj.emplace("z", Json{1.0});
        obj.emplace("a", Json{std::string("line\nbreak \x01")});
        obj.emplace("m", Json{Json::Array{Json{true}, Json{nullptr}, Json{0.5}}});
        const std::string out = sandpit::json::serialize(Json{obj});
        const std::string expected = R"({"a":"line\nbreak \u0001","m":[true,null,0.5],"z":1})";
        if (out != expected)
        {
            fail("serialize: got " + out);
        }
        if (sandpit::json::serialize(*sandpit::json::parse_json(out)) != out)
        {
            fail("serialize output must parse back to the same document");
        }
    }

    {
        const auto j = parse_ok(R"({"n": 5, "f": 1.5, "neg": -1, "big": 1e300, "s": "x", "b": false})");
        const auto& obj = *j.as_object();
        if (sandpit::json::get_unsigned(obj, "n") != 5u)
        {
            fail("get_unsigned whole number");
        }
        if (sandpit::json::get_unsigned(obj, "f").has_value() ||
            sandpit::json::get_unsigned(obj, "neg").has_value() ||
            sandpit::json::get_unsigned(obj, "big").has_value() ||
            sandpit::json::get_unsigned(obj, "s").has_value())
        {
            fail("get_unsigned must reject fractions, negatives, huge values and strings");
        }
        if (sandpit::json::get_bool(obj, "b") != false || sandpit::json::get_bool(obj, "n").has_value())
        {
            fail("get_bool");
        }
        if (sandpit::json::get_number(obj, "f") != 1.5 || sandpit::json::get_string(obj, "missing"))
        {
            fail("get_number / missing key");
        }
    }

    std::cout << "OK\n";
    return 0;
}
