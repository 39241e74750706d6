#pragma once

#include "gmock/gmock.h"
#include "sandbox/executor.hpp"

namespace runbox::test {

class mock_executor : public executor {
public:
    MOCK_METHOD(execution_result, execute, (const execution_request &request), (override));
};

inline execution_result output_result(const std::string &stdout_text, const std::string &stderr_text = "") {
    execution_result result;
    result.stdout_text = stdout_text;
    result.stderr_text = stderr_text;
    result.status = stderr_text.empty() ? execution_status::SUCCESS : execution_status::RUNTIME_ERROR;
    result.exit_code = stderr_text.empty() ? 0 : 1;
    return result;
}

}  // namespace runbox::test
