//
// Builder Generator
//
// Derives one chained setter per named field of a struct:
//
//   pub fn name<VALUE: Into<String>>(&mut self, value: VALUE) -> &mut Self {
//       self.name = value.into();
//       self
//   }
//
// and wraps them in an impl block carrying the struct's generic signature.
//

#pragma once

#include <string>
#include <vector>

#include "../ast.hh"
#include "../diagnostics.hh"
#include "../tokens.hh"
#include "codegen_error.hh"
#include "option_description.hh"

namespace buildergen::codegen {

/// The three fragments of a generic signature used by an impl block:
/// `impl <impl_generics> Name <type_generics> <where_clause>`
struct split_generics {
    ast::token_stream impl_generics;  ///< `< 'a , T : Clone , const N : usize >`, defaults stripped
    ast::token_stream type_generics;  ///< `< 'a , T , N >`
    ast::token_stream where_clause;   ///< `where T : Debug`, empty when there are no predicates
};

/// Splits declared generics into their impl-header fragments; all empty when there are no generics
split_generics split_for_impl(const ast::generics& generics);

/// A synthesized setter method
struct setter_method {
    ast::source_pos pos;                     ///< Position of the field
    std::string name;                        ///< Field name, also the method name
    std::string value_param;                 ///< Type parameter of the argument, normally `VALUE`
    ast::type field_type;
    std::vector<ast::attribute> attributes;  ///< Field attributes copied onto the method
    ast::token_stream visibility;            ///< Empty for private setters

    /// `pub fn name < VALUE : Into < T > > ( & mut self , value : VALUE ) -> & mut Self`
    [[nodiscard]] ast::token_stream signature() const;

    /// `self . name = value . into ( ) ;` and `self`
    [[nodiscard]] std::vector<ast::token_stream> body() const;

    /// Attributes, signature and braced body
    void to_tokens(ast::token_stream& out) const;
};

/// The impl block generated for one struct
struct builder_impl {
    ast::source_pos pos;
    std::string type_name;
    split_generics generics;
    std::vector<setter_method> setters;

    /// `impl <impl_generics> Name <type_generics>`, without the where clause
    [[nodiscard]] ast::token_stream header() const;

    void to_tokens(ast::token_stream& out) const;
    [[nodiscard]] ast::token_stream tokens() const;
};

/// Generator settings, changed through set_option()
struct generator_options {
    bool copy_attributes = true;            // copy-attributes
    std::string setter_visibility = "pub";  // setter-visibility: pub, pub(crate), private
    std::string value_param = "VALUE";      // value-param
};

class BuilderGenerator {
public:
    BuilderGenerator() = default;
    explicit BuilderGenerator(generator_options options);

    /// Options accepted by set_option(), with defaults and help text
    [[nodiscard]] static std::vector<OptionDescription> get_options();

    /// @throws option_error for an unknown option or a value of the wrong type
    void set_option(const std::string& name, const OptionValue& value);

    [[nodiscard]] const generator_options& options() const { return options_; }

    /// Generates the setters for a struct with named fields.
    ///
    /// Non-fatal findings (renamed type parameter, struct without fields)
    /// are appended to `diagnostics`.
    ///
    /// @throws shape_error for tuple structs, unit structs, enums and unions
    [[nodiscard]] builder_impl generate(const ast::struct_def& def, std::vector<diagnostic>& diagnostics) const;

private:
    generator_options options_;

    [[nodiscard]] std::string choose_value_param(const ast::struct_def& def,
                                                 std::vector<diagnostic>& diagnostics) const;
    [[nodiscard]] std::vector<ast::attribute> copied_attributes(const ast::field_def& field) const;
    [[nodiscard]] ast::token_stream setter_visibility(const ast::source_pos& pos) const;
};

/// True for the attributes a setter inherits from its field: doc comments, `doc`, `cfg` and `allow`
bool is_propagated_attribute(const ast::attribute& attr);

}  // namespace buildergen::codegen
