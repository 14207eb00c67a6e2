// tests/unit/driver/test_report_json.cpp - JSON run report schema
//
#include <gtest/gtest.h>

#include "numcast/driver/report_json.hpp"
#include "numcast/driver/runner.hpp"

using namespace numcast;

TEST(DriverReportJson, Schema)
{
  const RunResult result = Runner::run_source(
    "report.ncs",
    "var f0 = <f32>0.0;\n"
    "assert(<bool>f0 == false);\n"
    "assert(<bool>f0 == true);\n",
    RunOptions{});

  const nlohmann::json j = to_json(result);
  EXPECT_EQ(j["success"], false);

  ASSERT_EQ(j["scripts"].size(), 1U);
  const auto & script = j["scripts"][0];
  EXPECT_EQ(script["path"], "report.ncs");
  EXPECT_EQ(script["passed"], 1);
  EXPECT_EQ(script["failed"], 1);
  ASSERT_EQ(script["assertions"].size(), 2U);
  EXPECT_EQ(script["assertions"][0]["line"], 2);
  EXPECT_EQ(script["assertions"][0]["column"], 1);
  EXPECT_EQ(script["assertions"][0]["passed"], true);
  EXPECT_EQ(script["assertions"][1]["text"], "assert(<bool>f0 == true)");
  EXPECT_EQ(script["assertions"][1]["passed"], false);

  ASSERT_EQ(j["diagnostics"].size(), 1U);
  const auto & diag = j["diagnostics"][0];
  EXPECT_EQ(diag["severity"], "error");
  EXPECT_EQ(diag["code"], "E0301");
  EXPECT_EQ(diag["message"], "assertion failed");
  EXPECT_EQ(diag["path"], "report.ncs");
  EXPECT_EQ(diag["line"], 3);
  EXPECT_EQ(diag["column"], 8);
}

TEST(DriverReportJson, DiagnosticWithoutLocationHasNullPosition)
{
  const RunResult result = Runner::run_file("/nonexistent/x.ncs", RunOptions{});
  const nlohmann::json j = to_json(result);

  ASSERT_EQ(j["diagnostics"].size(), 1U);
  EXPECT_TRUE(j["diagnostics"][0]["path"].is_null());
  EXPECT_TRUE(j["diagnostics"][0]["line"].is_null());
  EXPECT_TRUE(j["diagnostics"][0]["code"].is_null());
  EXPECT_TRUE(j["scripts"].empty());
}
