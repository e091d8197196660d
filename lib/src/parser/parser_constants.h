/*
 * Parser constants - named constants to replace magic numbers
 *
 * Plain C macros: this header is included by the generated C scanner and
 * grammar as well as by the C++ bridge.
 */

#ifndef BUILDERGEN_PARSER_CONSTANTS_H
#define BUILDERGEN_PARSER_CONSTANTS_H

/* Bytes of zero padding after the input for re2c lookahead */
#define PARSER_INPUT_BUFFER_PADDING 32

/* Error message buffer size */
#define PARSER_ERROR_MESSAGE_BUFFER_SIZE 256

/* Maximum nesting of (), [] and {} accepted by the scanner */
#define PARSER_MAX_DELIMITER_DEPTH 256

#endif /* BUILDERGEN_PARSER_CONSTANTS_H */
