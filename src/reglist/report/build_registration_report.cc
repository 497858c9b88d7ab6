#include <cstdint>
#include <optional>
#include <reglib/result.hh>
#include <reglist/loader/loader.hh>
#include <reglist/report/build_registration_report.hh>
#include <reglist/report/registration_report.hh>
#include <utility>

namespace reglist::report {

Result<RegistrationReport, NotFound>
build_registration_report(mysql::Connection& mysql, uint64_t competition_id) {
    auto relations = loader::load_relations(mysql, competition_id);
    if (!relations) {
        return Err{NotFound{competition_id}};
    }
    return make_registration_report(
        competition_id,
        std::move(relations->competition),
        std::move(relations->races),
        std::move(relations->special_categories),
        std::move(relations->participants),
        relations->memberships
    );
}

} // namespace reglist::report
