#pragma once

#include <cstdint>
#include <reglib/result.hh>
#include <reglist/mysql/mysql.hh>
#include <reglist/report/registration_report.hh>

namespace reglist::report {

// Loads relations of the competition @p competition_id and assembles its report. Errors are the
// same as of loader::load_relations() and make_registration_report().
Result<RegistrationReport, NotFound>
build_registration_report(mysql::Connection& mysql, uint64_t competition_id);

} // namespace reglist::report
