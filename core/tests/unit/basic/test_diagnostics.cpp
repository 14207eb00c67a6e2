// tests/unit/basic/test_diagnostics.cpp - DiagnosticBag and DiagnosticPrinter
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "numcast/basic/diagnostic.hpp"
#include "numcast/basic/diagnostic_printer.hpp"
#include "numcast/basic/source_manager.hpp"

using namespace numcast;

TEST(BasicDiagnosticBag, BuilderCommitsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto b = bag.report_error(SourceRange{}, "boom");
    b.with_code("E0999");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].code, "E0999");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_code("E0999"));
  EXPECT_FALSE(bag.has_code("E0000"));
}

TEST(BasicDiagnosticBag, CountsOnlyErrors)
{
  DiagnosticBag bag;
  bag.report_warning(SourceRange{}, "careful");
  bag.report_info(SourceRange{}, "fyi");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_EQ(bag.error_count(), 0U);

  DiagnosticBag other;
  other.report_error(SourceRange{}, "bad");
  bag.merge(std::move(other));
  EXPECT_EQ(bag.size(), 3U);
  EXPECT_EQ(bag.error_count(), 1U);
  EXPECT_EQ(bag.errors().size(), 1U);
}

TEST(BasicSourceRegistry, LineColumnAndSlices)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("a.ncs", "var x = 1;\nassert(true);\n");
  ASSERT_TRUE(id.is_valid());

  const SourceRange r(id, 11, 17);
  EXPECT_EQ(sources.get_slice(r), "assert");
  const auto lc = sources.get_line_column(r.get_begin());
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 1U);

  // Re-registering a path reuses its id.
  EXPECT_EQ(sources.register_file("a.ncs", "var y = 2;"), id);
  EXPECT_EQ(sources.size(), 1U);
  EXPECT_EQ(sources.get_file(id)->content(), "var y = 2;");
}

TEST(BasicDiagnosticPrinter, RustStyleOutput)
{
  SourceRegistry sources;
  const FileId id =
    sources.register_file("bool.ncs", "var f1 = <f32>-0.0;\nassert(<bool>f1 == true);\n");

  DiagnosticBag bag;
  bag.report_error(SourceRange(id, 27, 43), "assertion failed", "evaluated to `false == true`")
    .with_code("E0301")
    .with_help("`f1` is f32 -0.0");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0301]: assertion failed"), std::string::npos) << text;
  EXPECT_NE(text.find("bool.ncs:2:8"), std::string::npos) << text;
  EXPECT_NE(text.find("assert(<bool>f1 == true);"), std::string::npos) << text;
  EXPECT_NE(text.find("^^^^^^^^^^^^^^^^ evaluated to `false == true`"), std::string::npos)
    << text;
  EXPECT_NE(text.find("= help: `f1` is f32 -0.0"), std::string::npos) << text;
}

TEST(BasicDiagnosticPrinter, DiagnosticWithoutLocation)
{
  SourceRegistry sources;
  DiagnosticBag bag;
  bag.report_error(SourceRange{}, "file not found: missing.ncs");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sources);

  EXPECT_NE(out.str().find("error: file not found: missing.ncs"), std::string::npos);
  EXPECT_NE(out.str().find("<unknown>"), std::string::npos);
}
