// Request Scanner tests
//
// Tests for extracting import requests from ECMAScript and CSS sources.

#include "modules/request_scanner.hpp"

#include <gtest/gtest.h>

using namespace weave::modules;
using Requests = std::vector<std::string>;

// ============================================================================
// ECMAScript
// ============================================================================

TEST(EcmascriptScannerTest, ImportForms) {
    auto requests = scan_ecmascript_requests(R"(
import React from "react";
import { a, b } from './lib/ab';
import * as ns from '../ns';
import './polyfill';
export { c } from "./c";
export * from './all';
const lazy = import('./lazy');
const fs = require("fs-extra");
)");
    EXPECT_EQ(requests, (Requests{"react", "./lib/ab", "../ns", "./polyfill", "./c", "./all",
                                  "./lazy", "fs-extra"}));
}

TEST(EcmascriptScannerTest, MultiLineImport) {
    auto requests = scan_ecmascript_requests("import {\n  one,\n  two,\n} from './numbers';\n");
    EXPECT_EQ(requests, Requests{"./numbers"});
}

TEST(EcmascriptScannerTest, DuplicatesKeepFirstPosition) {
    auto requests = scan_ecmascript_requests(
        "import a from './a';\nimport b from './b';\nconst again = require('./a');\n");
    EXPECT_EQ(requests, (Requests{"./a", "./b"}));
}

TEST(EcmascriptScannerTest, IdentifiersContainingKeywordsAreIgnored) {
    auto requests = scan_ecmascript_requests(
        "const reimport = 1;\nmyrequire('./x');\nexporter.from('./y');\n");
    EXPECT_TRUE(requests.empty());
}

TEST(EcmascriptScannerTest, NonLiteralDynamicImportIsIgnored) {
    auto requests = scan_ecmascript_requests("import(`./pages/${name}`);\nrequire(path);\n");
    EXPECT_TRUE(requests.empty());
}

TEST(EcmascriptScannerTest, EmptySource) {
    EXPECT_TRUE(scan_ecmascript_requests("").empty());
}

TEST(EcmascriptScannerTest, FailedCallDoesNotHideTheNextOne) {
    auto requests = scan_ecmascript_requests("import('a import('b');\n");
    EXPECT_EQ(requests, Requests{"b"});
}

TEST(EcmascriptScannerTest, KeywordAfterDollarStillCounts) {
    EXPECT_EQ(scan_ecmascript_requests("$import('./x');"), Requests{"./x"});
}

// ============================================================================
// Large inputs
// ============================================================================

TEST(EcmascriptScannerTest, HugeImportClause) {
    auto source = "import {" + std::string(200000, 'a') + "} from './x.js';";
    EXPECT_EQ(scan_ecmascript_requests(source), Requests{"./x.js"});
}

TEST(EcmascriptScannerTest, HugeClauseWithoutFrom) {
    auto source = "export {" + std::string(200000, 'a') + "};\nimport './after';\n";
    EXPECT_EQ(scan_ecmascript_requests(source), Requests{"./after"});
}

TEST(EcmascriptScannerTest, ManyKeywordsInOneClause) {
    std::string source;
    for (int i = 0; i < 50000; ++i) {
        source += "export import ";
    }
    source += "x from './last';";
    EXPECT_EQ(scan_ecmascript_requests(source), Requests{"./last"});
}

TEST(EcmascriptScannerTest, HugeUnterminatedString) {
    std::string source;
    for (int i = 0; i < 1000; ++i) {
        source += "require('";
    }
    source += std::string(200000, 'b');
    EXPECT_TRUE(scan_ecmascript_requests(source).empty());
}

// ============================================================================
// CSS
// ============================================================================

TEST(CssScannerTest, ImportForms) {
    auto requests = scan_css_requests(R"(
@import "reset.css";
@import './theme.css' screen;
@import url("fonts.css");
@import url(print.css) print;
@import "~normalize.css/normalize.css";
@import "https://fonts.example.com/inter.css";
body { color: red; }
)");
    EXPECT_EQ(requests, (Requests{"./reset.css", "./theme.css", "./fonts.css", "./print.css",
                                  "normalize.css/normalize.css",
                                  "https://fonts.example.com/inter.css"}));
}

TEST(CssScannerTest, BackgroundUrlsAreNotImports) {
    EXPECT_TRUE(scan_css_requests("body { background: url(bg.png); }").empty());
}

TEST(CssScannerTest, HugeImportUrl) {
    auto source = "@import url(" + std::string(200000, 'c') + ".css);\n";
    EXPECT_EQ(scan_css_requests(source), Requests{"./" + std::string(200000, 'c') + ".css"});
}

TEST(CssScannerTest, MissingWhitespaceIsNotAnImport) {
    EXPECT_TRUE(scan_css_requests("@import'a.css';").empty());
}
