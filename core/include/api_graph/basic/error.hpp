// api_graph/basic/error.hpp - Errors that abort an analysis run
//
// Every failure inside the analyzer is fatal to the run. Failures caused by
// the analyzed project (an export pattern we cannot represent) are
// ConfigurationErrors; violated oracle/analyzer assumptions are
// InternalErrors and always indicate a defect.
//
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace api_graph
{

enum class ErrorKind : uint8_t {
  Configuration,  ///< The analyzed project uses an unsupported construct
  Internal,       ///< An assumption about the oracle or the graph was violated
};

/**
 * Diagnostic codes carried by errors.
 *
 * E1xx: configuration errors, E9xx: internal errors.
 */
namespace error_code
{
inline constexpr const char * k_unsupported_export = "E101";
inline constexpr const char * k_unsupported_export_declaration = "E102";
inline constexpr const char * k_missing_parent_declaration = "E901";
inline constexpr const char * k_unresolved_specifier = "E902";
inline constexpr const char * k_import_after_registration = "E903";
inline constexpr const char * k_unsupported_declaration = "E904";
inline constexpr const char * k_export_not_found = "E905";
inline constexpr const char * k_symbol_without_declarations = "E906";
inline constexpr const char * k_unresolved_reference = "E907";
inline constexpr const char * k_declaration_lookup = "E908";
inline constexpr const char * k_state_transition = "E909";
}  // namespace error_code

/**
 * Base class of all analysis errors.
 */
class Error : public std::runtime_error
{
public:
  Error(ErrorKind kind, std::string code, const std::string & message)
  : std::runtime_error(message), kind_(kind), code_(std::move(code))
  {
  }

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

  /// Diagnostic code, e.g. "E101"
  [[nodiscard]] const std::string & code() const noexcept { return code_; }

  /// Module file in which the error was detected; empty when unknown
  [[nodiscard]] const std::string & module_file() const noexcept { return module_file_; }

  /// Symbols under analysis when the error was raised, outermost first
  [[nodiscard]] const std::vector<std::string> & analysis_chain() const noexcept
  {
    return analysis_chain_;
  }

  /// Record the module being processed; the innermost one is kept
  void note_module(std::string file)
  {
    if (module_file_.empty()) {
      module_file_ = std::move(file);
    }
  }

  /// Record a symbol whose analysis the error propagates through
  void note_symbol(std::string name)
  {
    analysis_chain_.insert(analysis_chain_.begin(), std::move(name));
  }

private:
  ErrorKind kind_;
  std::string code_;
  std::string module_file_;
  std::vector<std::string> analysis_chain_;
};

/**
 * The analyzed project uses an export pattern the analyzer does not support.
 */
class ConfigurationError : public Error
{
public:
  ConfigurationError(std::string code, const std::string & message)
  : Error(ErrorKind::Configuration, std::move(code), message)
  {
  }
};

/**
 * An assumption about the oracle or the constructed graph was violated.
 */
class InternalError : public Error
{
public:
  InternalError(std::string code, const std::string & message)
  : Error(ErrorKind::Internal, std::move(code), "internal error: " + message)
  {
  }
};

}  // namespace api_graph
