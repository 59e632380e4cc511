#include "errors.hh"

namespace arbgen{

error::error(const std::string &_kind,
             const std::string &_name,
             const std::string &_detail) :
    std::runtime_error(_kind + ": " + _name + ": " + _detail),
    category(_kind),
    field(_name)
{
}

}
