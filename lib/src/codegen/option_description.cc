//
// Generator option value parsing
//

#include <buildergen/codegen/option_description.hh>
#include <buildergen/codegen/codegen_error.hh>

#include <algorithm>

namespace buildergen::codegen {

OptionValue parse_option_value(const OptionDescription& option, const std::string& text) {
    switch (option.type) {
        case OptionType::Bool: {
            if (text == "true" || text == "yes" || text == "on" || text == "1") {
                return true;
            }
            if (text == "false" || text == "no" || text == "off" || text == "0") {
                return false;
            }
            throw option_error(
                "Invalid boolean value for " + option.name + ": " + text +
                " (expected: true/false, yes/no, on/off, 1/0)",
                option.name
            );
        }

        case OptionType::String:
            if (text.empty()) {
                throw option_error("Option " + option.name + " requires a non-empty value", option.name);
            }
            return text;

        case OptionType::Choice: {
            if (std::find(option.choices.begin(), option.choices.end(), text) == option.choices.end()) {
                std::string choices_str;
                for (size_t i = 0; i < option.choices.size(); ++i) {
                    if (i > 0) choices_str += ", ";
                    choices_str += option.choices[i];
                }
                throw option_error(
                    "Invalid choice for " + option.name + ": " + text +
                    "\nValid choices: " + choices_str,
                    option.name
                );
            }
            return text;
        }
    }
    throw option_error("Unsupported option type for " + option.name, option.name);
}

}  // namespace buildergen::codegen
