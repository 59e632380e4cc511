// error taxonomy shared by the synthesis and pdw encoding paths
#ifndef ARBGEN_ERRORS_HH
#define ARBGEN_ERRORS_HH

#include <stdexcept>
#include <string>

namespace arbgen{

// base for every error raised by arbgen, carries the offending field or
// parameter name so callers can report it without parsing what()
class error : public std::runtime_error
{
  public:
    error(const std::string &_kind,
          const std::string &_name,
          const std::string &_detail);
    virtual ~error() {}

    const std::string & name() const { return field; }
    const std::string & kind() const { return category; }

  protected:
    std::string category;
    std::string field;
};

// scalar argument outside its documented domain
class invalid_parameter : public error
{
  public:
    invalid_parameter(const std::string &_name, const std::string &_detail)
        : error("invalid_parameter", _name, _detail) {}
};

// scheme, filter, barker code or phase relationship that is not enumerated
class unsupported_modulation : public error
{
  public:
    unsupported_modulation(const std::string &_name, const std::string &_detail)
        : error("unsupported_modulation", _name, _detail) {}
};

// length/granularity correction could not satisfy the device profile
class waveform_constraint_violation : public error
{
  public:
    waveform_constraint_violation(const std::string &_name, const std::string &_detail)
        : error("waveform_constraint_violation", _name, _detail) {}
};

// pdw field beyond its variant's range or bit width
class pdw_field_out_of_range : public error
{
  public:
    pdw_field_out_of_range(const std::string &_name, const std::string &_detail)
        : error("pdw_field_out_of_range", _name, _detail) {}
};

// operation code ordering violated at file assembly time
class invalid_pdw_sequence : public error
{
  public:
    invalid_pdw_sequence(const std::string &_name, const std::string &_detail)
        : error("invalid_pdw_sequence", _name, _detail) {}
};

}

#endif // ARBGEN_ERRORS_HH
