//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runParserTests();
bool runAttributeResolverTests();
bool runBoundInferenceTests();
bool runAnalyzerTests();
bool runCppEmitterTests();
bool runGeneratedOutputTests();
bool runToolConfigTests();
bool runRuntimeTests();

int main()
{
    bool ok = true;
    ok      = runParserTests() && ok;
    ok      = runAttributeResolverTests() && ok;
    ok      = runBoundInferenceTests() && ok;
    ok      = runAnalyzerTests() && ok;
    ok      = runCppEmitterTests() && ok;
    ok      = runGeneratedOutputTests() && ok;
    ok      = runToolConfigTests() && ok;
    ok      = runRuntimeTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
