#include <unity.h>

#include <limits>
#include <string>
#include <vector>

#include "JsonPath.hpp"

using wsb::Json;
using wsb::JsonPath;

static std::vector<Json> eval(const std::string& expr, const Json& doc) {
    std::string err;
    auto path = JsonPath::compile(expr, err);
    TEST_ASSERT_TRUE_MESSAGE(path.has_value(), err.c_str());
    std::vector<Json> out;
    for (const Json* m : path->evaluate(doc)) out.push_back(*m);
    return out;
}

static const Json& printer_frame() {
    static const Json doc = Json::parse(R"({
        "printProgress": 42,
        "nozzle": {"temp": 210.5, "target": 215},
        "bed": {"temp": 60.1, "target": 60},
        "files": [
            {"name": "a.gcode", "size": 10},
            {"name": "b.gcode", "size": 20},
            {"name": "c.gcode", "size": 30}
        ],
        "odd key": "spaced"
    })");
    return doc;
}

void test_dotted_child_and_root() {
    auto r = eval("$.nozzle.temp", printer_frame());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(r.size()));
    TEST_ASSERT_TRUE(r[0] == Json(210.5));

    auto root = eval("$", printer_frame());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(root.size()));
    TEST_ASSERT_TRUE(root[0] == printer_frame());
}

void test_bare_name_is_relative_to_root() {
    auto r = eval("printProgress", printer_frame());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(r.size()));
    TEST_ASSERT_TRUE(r[0] == Json(42));
    TEST_ASSERT_TRUE(eval("bed.target", printer_frame())[0] == Json(60));
}

void test_bracket_names_and_indices() {
    TEST_ASSERT_TRUE(eval("$['odd key']", printer_frame())[0] == Json("spaced"));
    TEST_ASSERT_TRUE(eval("$[\"nozzle\"][\"target\"]", printer_frame())[0] == Json(215));
    TEST_ASSERT_TRUE(eval("$.files[1].name", printer_frame())[0] == Json("b.gcode"));
    TEST_ASSERT_TRUE(eval("$.files[-1].size", printer_frame())[0] == Json(30));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(eval("$.files[7]", printer_frame()).size()));
}

void test_wildcards_follow_document_order() {
    auto names = eval("$.files[*].name", printer_frame());
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(names.size()));
    TEST_ASSERT_TRUE(names[0] == Json("a.gcode"));
    TEST_ASSERT_TRUE(names[2] == Json("c.gcode"));

    auto temps = eval("$.*.temp", printer_frame());
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(temps.size()));
    TEST_ASSERT_TRUE(temps[0] == Json(210.5));
    TEST_ASSERT_TRUE(temps[1] == Json(60.1));
}

void test_recursive_descent_is_preorder() {
    Json doc = Json::parse(R"({"temp": 1, "a": {"temp": 2, "b": [{"temp": 3}]}, "c": {"temp": 4}})");
    auto r = eval("$..temp", doc);
    TEST_ASSERT_EQUAL_INT(4, static_cast<int>(r.size()));
    TEST_ASSERT_TRUE(r[0] == Json(1));
    TEST_ASSERT_TRUE(r[1] == Json(2));
    TEST_ASSERT_TRUE(r[2] == Json(3));
    TEST_ASSERT_TRUE(r[3] == Json(4));

    auto sizes = eval("$..[1].size", printer_frame());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(sizes.size()));
    TEST_ASSERT_TRUE(sizes[0] == Json(20));
}

void test_slices_and_unions() {
    auto mid = eval("$.files[1:3].size", printer_frame());
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(mid.size()));
    TEST_ASSERT_TRUE(mid[0] == Json(20));
    TEST_ASSERT_TRUE(mid[1] == Json(30));

    auto rev = eval("$.files[::-1].size", printer_frame());
    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(rev.size()));
    TEST_ASSERT_TRUE(rev[0] == Json(30));

    auto uni = eval("$.files[2,0].name", printer_frame());
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(uni.size()));
    TEST_ASSERT_TRUE(uni[0] == Json("c.gcode"));
    TEST_ASSERT_TRUE(uni[1] == Json("a.gcode"));

    auto keys = eval("$.nozzle['target','temp']", printer_frame());
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(keys.size()));
    TEST_ASSERT_TRUE(keys[0] == Json(215));
}

void test_missing_paths_yield_nothing() {
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(eval("$.nope", printer_frame()).size()));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(eval("$.printProgress.deeper", printer_frame()).size()));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(eval("$.nozzle[0]", printer_frame()).size()));
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(eval("$.x", Json(5)).size()));

    std::string err;
    auto path = JsonPath::compile("$.nope", err);
    TEST_ASSERT_TRUE(path.has_value());
    TEST_ASSERT_NULL(path->first(printer_frame()));
}

void test_invalid_expressions_are_rejected() {
    const char* bad[] = {"", "$.", "$.a[", "$.a[1:2:0]", "$.a['x'", "$.a[foo]", "$a", "$.a[1:2:3:4]"};
    for (const char* expr : bad) {
        std::string err;
        TEST_ASSERT_FALSE_MESSAGE(JsonPath::compile(expr, err).has_value(), expr);
        TEST_ASSERT_FALSE(err.empty());
    }
}

void test_recursive_descent_survives_deep_nesting() {
    const size_t depth = 200000;
    std::string text = "{\"a\":" + std::string(depth, '[') + "{\"progress\":7}" + std::string(depth, ']') + "}";
    Json doc = Json::parse(text);

    auto r = eval("$..progress", doc);
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(r.size()));
    TEST_ASSERT_TRUE(r[0] == Json(7));

    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(eval("$..missing", doc).size()));
}

void test_slices_with_extreme_steps() {
    const std::string maxStep = std::to_string(std::numeric_limits<long>::max());
    const std::string minStep = std::to_string(std::numeric_limits<long>::min());

    auto fwd = eval("$.files[0:3:" + maxStep + "].size", printer_frame());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(fwd.size()));
    TEST_ASSERT_TRUE(fwd[0] == Json(10));

    auto back = eval("$.files[::" + minStep + "].size", printer_frame());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(back.size()));
    TEST_ASSERT_TRUE(back[0] == Json(30));

    auto stride = eval("$.files[::2].size", printer_frame());
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(stride.size()));
    TEST_ASSERT_TRUE(stride[1] == Json(30));

    auto backStride = eval("$.files[2:0:-2].size", printer_frame());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(backStride.size()));
    TEST_ASSERT_TRUE(backStride[0] == Json(30));
}
