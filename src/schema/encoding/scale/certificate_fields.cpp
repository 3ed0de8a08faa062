#include <veritas/schema/encoding/scale/certificate_fields.hpp>

namespace veritas::schema {

void encode(const certificate_fields<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.institution_id, encoder);
  encode(o.student_name, encoder);
  encode(o.roll_number, encoder);
  encode(o.course_name, encoder);
  encode(o.grade, encoder);
  encode(o.issue_date, encoder);
}

void decode(certificate_fields<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.institution_id, decoder);
  decode(o.student_name, decoder);
  decode(o.roll_number, decoder);
  decode(o.course_name, decoder);
  decode(o.grade, decoder);
  decode(o.issue_date, decoder);
}

}  // namespace veritas::schema
