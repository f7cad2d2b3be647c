#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "arxml/document/errors.hpp"
#include "arxml/error/exception.hpp"

using namespace arxml::error;

TEST(ExceptionTest, FormatsMessage) {
    try {
        THROW_EXCEPTION("Value {} out of range [{}, {}]", 12, 0, 10);
        FAIL() << "Expected exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.getMessage(), "Value 12 out of range [0, 10]");
    }
}

TEST(ExceptionTest, RecordsSourceLocation) {
    try {
        THROW_EXCEPTION("located");
        FAIL() << "Expected exception";
    } catch (const Exception& e) {
        EXPECT_NE(e.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_GT(e.getLine(), 0);
        EXPECT_FALSE(e.getFunction().empty());
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST(ExceptionTest, WhatContainsLocationAndMessage) {
    try {
        THROW_EXCEPTION("Something went wrong: {}", "disk full");
        FAIL() << "Expected exception";
    } catch (const std::exception& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("Message: Something went wrong: disk full"),
                  std::string::npos);
        EXPECT_NE(what.find("File: "), std::string::npos);
        EXPECT_NE(what.find("Line: "), std::string::npos);
    }
}

TEST(ExceptionTest, DocumentErrorsShareBase) {
    EXPECT_THROW(THROW_NOT_FOUND("missing {}", "a.arxml"),
                 arxml::document::NotFoundError);
    EXPECT_THROW(THROW_INVALID_QUERY("bad query"),
                 arxml::document::DocumentError);
    EXPECT_THROW(THROW_NO_OUTPUT_PATH("no path"), Exception);
}

TEST(ExceptionTest, DocumentErrorKindsAreDistinct) {
    try {
        THROW_NO_DOCUMENT_LOADED("nothing loaded");
        FAIL() << "Expected exception";
    } catch (const arxml::document::NoOutputPathError&) {
        FAIL() << "Caught as the wrong kind";
    } catch (const arxml::document::NoDocumentLoadedError& e) {
        EXPECT_EQ(e.getMessage(), "nothing loaded");
    }
}
