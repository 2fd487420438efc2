#include "pathfinder/ErrorReporter.hpp"

#include "doctest/doctest.h"

namespace pathfinder {

TEST_CASE("ErrorReporter bookkeeping") {
    SUBCASE("starts empty") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.errorCount() == 0);
        CHECK(er.lastErrorMessage().empty());
    }
    SUBCASE("keeps errors in order") {
        ErrorReporter er(true);
        er.addError(ErrorReporter::kFraming, "first");
        er.addError(ErrorReporter::kProtocol, "second");
        CHECK(!er.ok());
        REQUIRE(er.errorCount() == 2);
        CHECK(er.errors()[0].kind == ErrorReporter::kFraming);
        CHECK(er.errors()[1].message == "second");
        CHECK(er.lastErrorMessage() == "second");
        CHECK(er.hasErrorOfKind(ErrorReporter::kProtocol));
        CHECK(!er.hasErrorOfKind(ErrorReporter::kTimeout));
    }
    SUBCASE("timeout names the method") {
        ErrorReporter er(true);
        er.addTimeoutError("textDocument/definition", std::chrono::milliseconds(15000));
        REQUIRE(er.errorCount() == 1);
        CHECK(er.errors()[0].kind == ErrorReporter::kTimeout);
        CHECK(er.lastErrorMessage().find("'textDocument/definition'") != std::string::npos);
        CHECK(er.lastErrorMessage().find("15000ms") != std::string::npos);
    }
    SUBCASE("reset clears") {
        ErrorReporter er(true);
        er.addFileNotFoundError("/nope");
        CHECK(er.hasErrorOfKind(ErrorReporter::kDocument));
        er.reset();
        CHECK(er.ok());
    }
}

} // namespace pathfinder
