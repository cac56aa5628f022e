//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runExpressionTests();
bool runSchemaCompilerTests();
bool runPrimitiveCodecTests();
bool runFunctionRegistryTests();
bool runSerializerTests();
bool runDeserializerTests();
bool runFormatHandlerTests();

int main()
{
    bool ok = true;
    ok      = runExpressionTests() && ok;
    ok      = runSchemaCompilerTests() && ok;
    ok      = runPrimitiveCodecTests() && ok;
    ok      = runFunctionRegistryTests() && ok;
    ok      = runSerializerTests() && ok;
    ok      = runDeserializerTests() && ok;
    ok      = runFormatHandlerTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
