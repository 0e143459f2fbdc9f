#include <tfd/description_parser.hpp>
#include <tfd/embed_writer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace tfd;

static bool
contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

// == Descriptions file =======================================================

TEST_CASE("read_descriptions: entries", "[embed_writer]") {
  auto entries = read_descriptions("# formats\n"
                                   "\n"
                                   "iso_date [year]-[month]-[day]\n"
                                   "  clock\t[hour]:[minute] \r\n"
                                   "spaced a b  c");
  REQUIRE(entries.size() == 3);

  CHECK(entries[0].name == "iso_date");
  CHECK(entries[0].source == "[year]-[month]-[day]");
  CHECK(entries[0].line == 3);
  CHECK(entries[0].column == 9);

  CHECK(entries[1].name == "clock");
  CHECK(entries[1].source == "[hour]:[minute] ");
  CHECK(entries[1].line == 4);
  CHECK(entries[1].column == 8);

  CHECK(entries[2].source == "a b  c");
}

TEST_CASE("read_descriptions: malformed lines", "[embed_writer]") {
  CHECK(read_descriptions("").empty());
  CHECK(read_descriptions("   \n# only a comment\n").empty());

  CHECK_THROWS_AS(read_descriptions("1st [year]"), std::invalid_argument);
  CHECK_THROWS_AS(read_descriptions("bad-name [year]"), std::invalid_argument);
  CHECK_THROWS_AS(read_descriptions("lonely"), std::invalid_argument);
  CHECK_THROWS_AS(read_descriptions("a [year]\na [day]"),
                  std::invalid_argument);
}

TEST_CASE("is_identifier", "[embed_writer]") {
  CHECK(is_identifier("iso_date"));
  CHECK(is_identifier("_x1"));
  CHECK_FALSE(is_identifier(""));
  CHECK_FALSE(is_identifier("9x"));
  CHECK_FALSE(is_identifier("a::b"));
  CHECK(is_identifier("a::b", true));
  CHECK_FALSE(is_identifier("a::", true));
  CHECK_FALSE(is_identifier("::a", true));
}

// == Header output ===========================================================

TEST_CASE("embed_writer: simple header", "[embed_writer]") {
  embed_writer writer("formats");
  auto out = writer.write({{"iso_date", compile("[year]-[month]")}});

  CHECK(out == "#pragma once\n"
               "\n"
               "// Generated by tfd-embed. Do not edit.\n"
               "\n"
               "#include <tfd/format_item.hpp>\n"
               "\n"
               "#include <string>\n"
               "#include <vector>\n"
               "\n"
               "namespace formats {\n"
               "\n"
               "  inline const tfd::format_description&\n"
               "  iso_date() {\n"
               "    static const tfd::format_description description{\n"
               "      tfd::component_spec{tfd::component_kind::year, "
               "tfd::modifiers{}},\n"
               "      tfd::literal_item{\"-\"},\n"
               "      tfd::component_spec{tfd::component_kind::month, "
               "tfd::modifiers{}},\n"
               "    };\n"
               "    return description;\n"
               "  }\n"
               "\n"
               "} // namespace formats\n");
}

TEST_CASE("embed_writer: modifiers", "[embed_writer]") {
  embed_writer writer;
  auto out = writer.write(
      {{"clock", compile("[hour repr:12 padding:none] [period case:lower]")},
       {"stamp", compile("[unix_timestamp precision:millisecond "
                         "sign:mandatory][subsecond digits:3]")},
       {"names", compile("[weekday repr:monday one_indexed:false "
                         "case_sensitive:false][ignore count:4]")}});

  CHECK(contains(out, "namespace tfd_embedded {"));
  CHECK(contains(out, "tfd::modifiers{.pad = tfd::padding::none, "
                      ".hour = tfd::hour_repr::twelve}"));
  CHECK(contains(out, ".period_case = tfd::letter_case::lower"));
  CHECK(contains(out, "tfd::modifiers{.sign = tfd::sign_mode::mandatory, "
                      ".precision = tfd::timestamp_precision::millisecond}"));
  CHECK(contains(out, ".digits = 3"));
  CHECK(contains(out, "tfd::modifiers{.weekday = tfd::weekday_repr::monday, "
                      ".case_sensitive = false, .one_indexed = false}"));
  CHECK(contains(out, ".count = 4"));
}

TEST_CASE("embed_writer: year range and trailing input", "[embed_writer]") {
  embed_writer writer;
  auto out = writer.write(
      {{"bounded", compile("[year repr:century range:standard base:iso_week]"
                           "[end trailing_input:discard]")}});

  CHECK(contains(out, "tfd::modifiers{.year = tfd::year_repr::century, "
                      ".range = tfd::year_range::standard, "
                      ".base = tfd::year_base::iso_week}"));
  CHECK(contains(out, "tfd::component_spec{tfd::component_kind::end, "
                      "tfd::modifiers{.trailing = "
                      "tfd::trailing_input::discard}}"));
}

TEST_CASE("embed_writer: groups", "[embed_writer]") {
  embed_writer writer;
  auto out = writer.write(
      {{"groups", compile("version = 2, [optional [T]][first [] [x]]")}});

  CHECK(contains(out, "tfd::optional_item{std::vector<tfd::format_item>{\n"));
  CHECK(contains(out, "tfd::first_item{"
                      "std::vector<std::vector<tfd::format_item>>{\n"));
  CHECK(contains(out, "std::vector<tfd::format_item>{},\n"));
}

TEST_CASE("embed_writer: literal escaping", "[embed_writer]") {
  embed_writer writer;
  format_description d{literal_item{"a\"b\\c\td"}};
  auto out = writer.write({{"quoted", d}});
  CHECK(contains(out, R"(tfd::literal_item{"a\"b\\c\011d"})"));

  format_description nul{literal_item{std::string("a\0b", 3)}};
  out = writer.write({{"nul", nul}});
  CHECK(contains(out, R"(tfd::literal_item{std::string("a\000b", 3)})"));
}
