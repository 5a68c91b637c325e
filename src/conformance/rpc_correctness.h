#pragma once
#ifndef COSTCONFORM_RPC_CORRECTNESS_H
#define COSTCONFORM_RPC_CORRECTNESS_H

#include "conformance/category_module.h"

namespace costconform {

// Drives every method with a valid request and with requests the contract
// requires to be rejected, checking status codes and response shapes.
// Optional methods that are not advertised or answer Unimplemented are
// skipped.
class RpcCorrectnessModule : public CategoryModule {
public:
    TestCategory category() const override { return TestCategory::RPCCorrectness; }
    std::vector<TestResult> run(CheckContext& ctx) override;
};

}  // namespace costconform

#endif  // COSTCONFORM_RPC_CORRECTNESS_H
