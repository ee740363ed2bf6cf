// defcheck/rules/builtin_patterns.cpp - Built-in rule set
//
// Used when no rule file is configured and as the base layer that rule files
// override.
//
#include <utility>

#include "defcheck/rules/pattern_library.hpp"

namespace defcheck
{

namespace
{

RequiredElement element(
  std::string name, std::vector<std::string> keywords, std::string fix,
  Severity severity = Severity::Critical)
{
  RequiredElement e;
  e.name = std::move(name);
  e.keywords = std::move(keywords);
  e.fix_strategy = std::move(fix);
  e.severity = severity;
  return e;
}

PatternRule password_reset_rule()
{
  PatternRule r;
  r.id = "password_reset";
  r.name = "Password reset";
  r.detection_keywords = {"reset_password", "password_reset", "forgot_password"};
  r.required_elements = {
    element(
      "token_generation",
      {"secrets.token", "uuid.uuid", "random.", "generate_token", "create_token"},
      "Generate a cryptographically secure random token using secrets.token_urlsafe(32)"),
    element(
      "token_storage", {"db.session.add", "save", "store", ".insert", "database", "create("},
      "Store token in database with user_id, created_at, expires_at columns"),
    element(
      "expiry_check",
      {"expir", "timeout", "valid_until", "created_at", "ttl", "lifetime", "timedelta"},
      "Check if current time is before token.expires_at (typically 1 hour expiry)"),
    element(
      "invalidation_after_use", {"invalidate", ".delete", "used", "consumed", "revoke", "remove"},
      "Delete or mark token as used after successful password reset"),
    element(
      "rate_limiting",
      {"rate_limit", "throttle", "attempts", "cooldown", "backoff", "max_attempts"},
      "Limit password reset requests to 3 per hour per email"),
  };
  r.fix_strategy = "Implement every step of the password reset flow";
  return r;
}

PatternRule user_registration_rule()
{
  PatternRule r;
  r.id = "user_registration";
  r.name = "User registration";
  r.detection_keywords = {"register", "signup", "create_user"};
  r.required_elements = {
    element(
      "email_uniqueness_check",
      {".filter_by", ".exists", "check_email", "get_by_email", ".first()"},
      "Query database for existing user with email before creating"),
    element(
      "password_hashing", {"bcrypt", "hashpw", "pbkdf2", "argon", "scrypt", "hash_password"},
      "Use bcrypt.hashpw() or argon2 to hash password before storing"),
    element(
      "activation_email",
      {"send_email", "send_activation", "activation_email", "verify_email"},
      "Send email with activation link/token to verify email ownership"),
    element(
      "duplicate_prevention", {"integrityerror", "unique", "constraint", "rollback"},
      "Use database unique constraint on email column and handle exception"),
  };
  r.fix_strategy = "Implement every step of the registration flow";
  return r;
}

PatternRule authentication_rule()
{
  PatternRule r;
  r.id = "authentication";
  r.name = "Authentication";
  r.detection_keywords = {"login", "authenticate", "sign_in"};
  r.required_elements = {
    element(
      "password_verification",
      {"checkpw", "verify_password", "check_password", "validate_password", "password.verify"},
      "Use bcrypt.checkpw() or password_hash.verify() to verify password"),
    element(
      "session_creation", {"create_session", "generate_token", "jwt.encode", "set_cookie"},
      "Create session token/JWT after successful authentication"),
    element(
      "failed_attempt_tracking",
      {"failed_attempts", "login_attempts", "increment", "track_attempt"},
      "Increment failed_attempts counter on each failed login"),
    element(
      "account_lockout",
      {"user.locked", "account.locked", "is_locked", "disable", "suspend", "max_attempts",
       "account_lock", ".locked ="},
      "Lock account for 30 minutes after 5 failed attempts"),
  };
  r.fix_strategy = "Implement every step of the authentication flow";
  return r;
}

PatternRule payment_processing_rule()
{
  PatternRule r;
  r.id = "payment_processing";
  r.name = "Payment processing";
  r.detection_keywords = {"payment", "charge", "process_payment", "transaction"};
  r.required_elements = {
    element(
      "amount_validation", {"validate", "amount", "positive", "range", "decimal"},
      "Validate amount is positive decimal with max 2 decimal places"),
    element(
      "idempotency_check", {"idempotent", "duplicate", "unique_id", "transaction_id"},
      "Check if transaction_id already exists before processing"),
    element(
      "transaction_logging", {"log", "audit", "record", "history"},
      "Log all transaction details to audit table"),
    element(
      "rollback_mechanism", {"rollback", "revert", "undo", "compensate"},
      "Implement database transaction with rollback on failure"),
    element(
      "fraud_check", {"fraud", "risk", "verify", "suspicious"},
      "Integrate fraud detection service or implement basic risk scoring", Severity::Warning),
  };
  r.fix_strategy = "Implement every step of the payment flow";
  return r;
}

std::vector<RiskyCallGroup> builtin_error_handling()
{
  RiskyCallGroup db;
  db.name = "database_operations";
  db.call_patterns = {".execute", ".query",  ".insert", ".update", ".delete",
                      ".commit",  ".rollback", "execute", "query"};
  db.severity = Severity::Critical;
  db.description = "Database operation without error handling";
  db.fix_strategy =
    "Wrap database call in try/except to handle connection/timeout/constraint errors";

  RiskyCallGroup api;
  api.name = "external_api_calls";
  api.call_patterns = {"requests.", "httpx.", "urllib.", "aiohttp."};
  api.severity = Severity::Critical;
  api.description = "External API call without error handling";
  api.fix_strategy = "Wrap API call in try/except to handle timeout/connection/response errors";

  RiskyCallGroup file;
  file.name = "file_operations";
  file.call_patterns = {"open"};
  file.severity = Severity::Warning;
  file.with_statement_ok = true;
  file.description = "File operation without explicit error handling";
  file.fix_strategy = "Add try/except to handle FileNotFoundError and PermissionError";

  return {std::move(db), std::move(api), std::move(file)};
}

}  // namespace

PatternLibrary PatternLibrary::builtin()
{
  PatternLibrary lib;
  lib.business_rules = {
    password_reset_rule(), user_registration_rule(), authentication_rule(),
    payment_processing_rule()};

  lib.error_handling = builtin_error_handling();

  lib.input_validation.enabled = true;
  lib.input_validation.min_parameters = 2;
  lib.input_validation.keywords = {"validate", "check",      "verify", "assert",
                                   "raise",    "isinstance", "if not"};

  lib.security.pii_fields = {"password", "ssn",     "social_security", "credit_card",
                             "card_number", "cvv",  "pin",             "secret",
                             "token",    "api_key", "private_key"};
  lib.security.sql_keywords = {"SELECT", "INSERT", "UPDATE", "DELETE", "DROP",
                               "CREATE", "ALTER",  "WHERE",  "FROM"};
  lib.security.logging_methods = {"debug", "info",      "warning", "warn",
                                  "error", "critical", "exception", "log"};
  lib.security.logger_receivers = {"logger", "log", "logging"};
  lib.security.route_decorators = {"route", "get", "post", "put", "delete", "patch"};
  lib.security.auth_markers = {"auth", "login", "require", "permission"};
  lib.security.public_endpoints = {"health", "metrics", "ping", "status"};

  lib.null_safety.safe_accessors = {"get", "keys", "values", "items"};
  lib.null_safety.safe_receivers = {"self", "cls"};

  lib.allowed_modules = {
    "os",       "sys",      "re",     "json",      "math",        "time",     "datetime",
    "logging",  "typing",   "pathlib", "collections", "itertools", "functools", "random",
    "secrets",  "hashlib",  "uuid",   "subprocess", "requests",    "httpx",    "urllib",
    "asyncio",  "threading", "socket", "shutil",    "tempfile",    "string",   "enum",
    "dataclasses", "copy",  "abc",    "decimal",   "base64",      "hmac",     "struct",
    "contextlib", "traceback", "inspect", "io", "csv", "pickle", "sqlite3", "np", "pd"};

  return lib;
}

}  // namespace defcheck
