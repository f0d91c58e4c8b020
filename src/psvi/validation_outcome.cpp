// validation_outcome.cpp - The PSVI record attached to each validated element.
//
// Error lists are held as shared immutable vectors so that merging an outcome into many elements does not copy them.
// Writers replace a list rather than modifying it in place.

#include <psvi/modules/psvi.h>
#include <psvi/log.h>

namespace psvi {

CSTRING to_string(VAT Attempted) noexcept
{
   switch (Attempted) {
      case VAT::NONE:    return "none";
      case VAT::PARTIAL: return "partial";
      case VAT::FULL:    return "full";
   }
   return "unknown";
}

CSTRING to_string(VALIDITY Validity) noexcept
{
   switch (Validity) {
      case VALIDITY::NOT_KNOWN: return "notKnown";
      case VALIDITY::INVALID:   return "invalid";
      case VALIDITY::VALID:     return "valid";
   }
   return "unknown";
}

//********************************************************************************************************************
// Replaces every field of this outcome with those of Source.  The schema value is only retained if the new type
// definition can carry one, i.e. it is a simple type or a complex type with simple content.

void ValidationOutcome::merge_from(const ValidationOutcome &Source)
{
   psvi::Log log(__FUNCTION__);

   if (&Source IS this) return;

   log.trace("Attempted: %s, Validity: %s, Type: %s", to_string(Source.attempted), to_string(Source.validity_state),
      Source.type_decl ? Source.type_decl->type_name.c_str() : "-");

   declaration    = Source.declaration;
   notation_decl  = Source.notation_decl;
   context        = Source.context;
   type_decl      = Source.type_decl;
   schema_info    = Source.schema_info;
   validity_state = Source.validity_state;
   attempted      = Source.attempted;
   codes          = Source.codes;
   messages       = Source.messages;

   if ((type_decl) and (type_decl->has_simple_value())) schema_val.copy_from(Source.schema_val);
   else schema_val.reset();

   specified_flag = Source.specified_flag;
   nil_flag       = Source.nil_flag;
}

// Validity can only be known if validation was attempted.  A validity other than NOT_KNOWN is ignored when Attempted
// is VAT::NONE.

void ValidationOutcome::set_validation(VAT Attempted, VALIDITY Validity) noexcept
{
   attempted = Attempted;
   validity_state = (Attempted IS VAT::NONE) ? VALIDITY::NOT_KNOWN : Validity;
}

void ValidationOutcome::add_error(std::string Code, std::string Message)
{
   auto new_codes = codes ? std::make_shared<StringList>(*codes) : std::make_shared<StringList>();
   auto new_messages = messages ? std::make_shared<StringList>(*messages) : std::make_shared<StringList>();
   new_codes->push_back(std::move(Code));
   new_messages->push_back(std::move(Message));
   codes = std::move(new_codes);
   messages = std::move(new_messages);
}

// Codes and messages are parallel lists and must be of equal length.

ERR ValidationOutcome::set_errors(StringList Codes, StringList Messages)
{
   psvi::Log log(__FUNCTION__);

   if (Codes.size() != Messages.size()) {
      log.warning("%d error codes were provided with %d messages.", int(Codes.size()), int(Messages.size()));
      return ERR::Mismatch;
   }

   if (Codes.empty()) {
      clear_errors();
      return ERR::Okay;
   }

   codes = std::make_shared<const StringList>(std::move(Codes));
   messages = std::make_shared<const StringList>(std::move(Messages));
   return ERR::Okay;
}

void ValidationOutcome::clear_errors() noexcept
{
   codes.reset();
   messages.reset();
}

std::optional<std::string> ValidationOutcome::schema_default() const
{
   if (not declaration) return std::nullopt;
   return declaration->constraint_value;
}

const std::optional<std::string> & ValidationOutcome::schema_normalized_value() const noexcept
{
   return schema_val.normalized_value();
}

const StringList & ValidationOutcome::error_codes() const noexcept
{
   if (codes) return *codes;
   return empty_string_list();
}

const StringList & ValidationOutcome::error_messages() const noexcept
{
   if (messages) return *messages;
   return empty_string_list();
}

const schema::TypeDefinition * ValidationOutcome::member_type_definition() const noexcept
{
   return schema_val.member_type();
}

const ActualValue & ValidationOutcome::actual_normalized_value() const noexcept
{
   return schema_val.actual_value();
}

schema::SchemaType ValidationOutcome::actual_normalized_value_type() const noexcept
{
   return schema_val.actual_value_kind();
}

const KindList & ValidationOutcome::item_value_types() const noexcept
{
   return schema_val.list_value_kinds();
}

} // namespace
