// test_log.cpp - Log level configuration, error messages and scope-managed log branches.

#include <psvi/main.h>
#include <psvi/log.h>
#include <string>
#include <vector>
#include "test_context.h"

void test_log_arguments(TestContext &Context) {
   auto original = psvi::GetLogLevel();

   CSTRING args[] = { "test_log", "--log-detail", "input.xml", "--log-threads" };
   std::vector<std::string> remaining;
   auto error = psvi::ProcessLogArgs(4, args, &remaining);
   Context.expect_true(error IS ERR::Okay, "Known switches are accepted");
   Context.expect_equal(psvi::GetLogLevel(), 6, "--log-detail selects level 6");
   Context.expect_equal(remaining.size(), std::size_t(1), "Non-log arguments are passed through");
   Context.expect_equal(remaining[0], std::string("input.xml"), "Pass-through argument is preserved");

   CSTRING bad_args[] = { "test_log", "--log-verbose", "--log-ERROR" };
   remaining.clear();
   error = psvi::ProcessLogArgs(3, bad_args, &remaining);
   Context.expect_true(error IS ERR::Args, "Unknown log switch is reported");
   Context.expect_equal(psvi::GetLogLevel(), 1, "Switches are case insensitive");
   Context.expect_equal(remaining.size(), std::size_t(1), "Unknown log switch is passed through");

   Context.expect_true(psvi::ProcessLogArgs(2, nullptr) IS ERR::NullArgs, "Missing argument list is rejected");
   Context.expect_true(psvi::ProcessLogArgs(0, nullptr) IS ERR::Okay, "Empty argument list is accepted");

   psvi::SetLogLevel(42);
   Context.expect_equal(psvi::GetLogLevel(), 9, "Level is clamped to the maximum");
   psvi::SetLogLevel(-3);
   Context.expect_equal(psvi::GetLogLevel(), 0, "Level is clamped to zero");

   psvi::SetLogLevel(original);
}

void test_error_messages(TestContext &Context) {
   Context.expect_equal(std::string(psvi::GetErrorMsg(ERR::Okay)), std::string("Operation successful."),
      "Okay has a message");
   Context.expect_equal(std::string(psvi::GetErrorMsg(ERR::NotSerialisable)),
      std::string("The object cannot be serialised."), "NotSerialisable has a message");
   Context.expect_equal(std::string(psvi::GetErrorMsg(ERR::END)), std::string("Unknown error code."),
      "END is not a valid code");
   Context.expect_equal(std::string(psvi::GetErrorMsg(ERR(-1))), std::string("Unknown error code."),
      "Negative codes are rejected");
}

void test_log_scope(TestContext &Context) {
   {
      psvi::Log log("test_log_scope");
      Context.expect_true(log.warning(ERR::Mismatch) IS ERR::Mismatch, "warning() returns the error code");
      Context.expect_true(log.error(ERR::NotFound) IS ERR::NotFound, "error() returns the error code");
      log.branch("Opening a branch");
      log.msg("Inside the branch");
   }

   {
      psvi::LogLevel level(2);
      psvi::Log log("test_log_scope");
      log.detail("Adjusted message");
   }
}

int main(int ArgCount, char **Args) {
   if (psvi::ProcessLogArgs(ArgCount, (CSTRING *)Args) != ERR::Okay) std::cout << "Ignoring unknown log switches.\n";

   TestContext test_context;
   test_log_arguments(test_context);
   test_error_messages(test_context);
   test_log_scope(test_context);
   test_context.summary();
   return test_context.failed_checks IS 0 ? 0 : 1;
}
