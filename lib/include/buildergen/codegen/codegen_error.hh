//
// Errors raised by the builder generator
//

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "../tokens.hh"

namespace buildergen::codegen {

/// The derive target is not a struct with named fields
class shape_error : public std::runtime_error {
public:
    shape_error(std::string type_name, ast::source_pos position)
        : std::runtime_error("#[derive(Builder)] can only be used with braced structs"),
          type_name_(std::move(type_name)),
          position_(std::move(position)) {
    }

    [[nodiscard]] const std::string& type_name() const { return type_name_; }
    [[nodiscard]] const ast::source_pos& position() const { return position_; }

private:
    std::string type_name_;
    ast::source_pos position_;
};

/// Unknown generator option or a value the option does not accept
class option_error : public std::runtime_error {
public:
    option_error(const std::string& msg, std::string option)
        : std::runtime_error(msg),
          option_(std::move(option)) {
    }

    [[nodiscard]] const std::string& option() const { return option_; }

private:
    std::string option_;
};

}  // namespace buildergen::codegen
