#include "exec/orchestrator.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "exec/extractor.hpp"
#include "exec/validator.hpp"
#include "exec/wrapper.hpp"

namespace pyexec {
using namespace std;

orchestrator::orchestrator(const configuration &config, sandbox &box)
    : config(config), box(box), fallback(config.fallback_signatures) {}

static execution_report make_report(structured_result &&result, execution_method method) {
    execution_report report;
    report.result = move(result.result);
    report.stdout_text = move(result.stdout_text);
    report.method = method;
    report.timestamp = iso_timestamp();
    return report;
}

outcome<execution_report> orchestrator::run(const script_submission &submit) {
    if (auto error = validate_script(submit.source)) {
        LOG(WARNING) << "Script validation failed: " << error->message;
        return *error;
    }

    wrapper_artifact artifact(config.script_dir, synthesize_wrapper(submit.source));

    auto sandboxed = box.run_sandboxed(artifact.path(), submit.timeout, submit.memory);
    if (auto error = get_if<failure>(&sandboxed))
        return *error;
    auto &outcome = get<execution_outcome>(sandboxed);

    extraction extracted = extract_result(outcome);
    if (auto result = get_if<structured_result>(&extracted))
        return make_report(move(*result), execution_method::SANDBOXED);
    if (auto error = get_if<failure>(&extracted))
        return *error;

    // 没有结果行且返回值非零
    if (!fallback.isolation_unavailable(outcome.stderr_text))
        return fallback_controller::script_failure(outcome, submit.timeout);

    LOG(WARNING) << "NSJail failed due to host limitations, falling back to direct execution";
    auto direct = fallback.run_direct(box, artifact.path(), submit);
    if (auto error = get_if<failure>(&direct))
        return *error;
    return make_report(move(get<structured_result>(direct)), execution_method::DIRECT);
}

outcome<execution_report> orchestrator::execute(const script_submission &submit) {
    outcome<execution_report> result = failure{error_type::INTERNAL_ERROR, "Internal server error"};
    try {
        result = run(submit);
    } catch (pyexec_exception &ex) {
        LOG(ERROR) << "Unexpected error: " << ex.what() << endl
                   << ex.trace();
        return failure{error_type::INTERNAL_ERROR, "Internal server error"};
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unexpected error: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return failure{error_type::INTERNAL_ERROR, "Internal server error"};
    }

    if (auto error = get_if<failure>(&result)) {
        if (error->type == error_type::EXECUTION_ERROR)
            LOG(ERROR) << "Script execution failed: " << error->message;
        else if (error->type == error_type::INTERNAL_ERROR)
            LOG(ERROR) << error->message;
    }
    return result;
}

}  // namespace pyexec
