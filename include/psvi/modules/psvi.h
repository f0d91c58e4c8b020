// psvi.h - Post-Schema-Validation Infoset support for element nodes.
//
// A validator computes a ValidationOutcome for each element during a validation pass and attaches it to the element's
// PSVIElement with attach_outcome().  Consumers then query the element for its validity, type and schema value without
// re-running validation.
//
// Thread safety: merge and attach operations are not synchronised.  A single writer per element is assumed, and readers
// must not run concurrently with a writer on the same element.  Schema components referenced by an outcome are shared
// read-only objects that are never modified here.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <psvi/main.h>
#include <psvi/modules/schema.h>

namespace psvi {

// Validation attempted

enum class VAT : int8_t {
   NONE = 0,
   PARTIAL = 1,
   FULL = 2
};

// Validity

enum class VALIDITY : int8_t {
   NOT_KNOWN = 0,
   INVALID = 1,
   VALID = 2
};

[[nodiscard]] CSTRING to_string(VAT Attempted) noexcept;
[[nodiscard]] CSTRING to_string(VALIDITY Validity) noexcept;

using StringList = std::vector<std::string>;
using KindList = std::vector<schema::SchemaType>;

// Shared immutable empty lists, returned in place of absent lists.  Every call returns the same instance.

[[nodiscard]] const StringList & empty_string_list() noexcept;
[[nodiscard]] const KindList & empty_kind_list() noexcept;

// Actual (typed) values.  std::monostate marks an absent value.

using AtomicValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
using ActualValue = std::variant<std::monostate, bool, int64_t, double, std::string, std::vector<AtomicValue>>;

//********************************************************************************************************************
// The outcome of validating an item's character content against a simple type.

class ValidatedValue {
   private:
   std::optional<std::string> normalized;
   ActualValue actual;
   schema::SchemaType actual_kind = schema::SchemaType::Unavailable;
   const schema::TypeDefinition * actual_type_ref = nullptr;
   const schema::TypeDefinition * member_type_ref = nullptr;
   KindList list_kinds;

   public:
   ValidatedValue() = default;

   void copy_from(const ValidatedValue &Source);
   void reset() noexcept;

   void set_value(std::string Normalized, ActualValue Actual, schema::SchemaType Kind,
      const schema::TypeDefinition *ActualType = nullptr, const schema::TypeDefinition *MemberType = nullptr);
   ERR set_list_value_kinds(KindList Kinds);

   [[nodiscard]] const ActualValue & actual_value() const noexcept { return actual; }
   [[nodiscard]] schema::SchemaType actual_value_kind() const noexcept { return actual_kind; }
   [[nodiscard]] const KindList & list_value_kinds() const noexcept;
   [[nodiscard]] const std::optional<std::string> & normalized_value() const noexcept { return normalized; }
   [[nodiscard]] const schema::TypeDefinition * actual_type() const noexcept { return actual_type_ref; }
   [[nodiscard]] const schema::TypeDefinition * member_type() const noexcept { return member_type_ref; }
   [[nodiscard]] bool empty() const noexcept;

   bool operator==(const ValidatedValue &) const = default;
};

//********************************************************************************************************************
// The PSVI record of a single element.  Fields are written by the validator through the set_*() methods, or replaced
// in full with merge_from().

class ValidationOutcome {
   private:
   const schema::ElementDeclaration * declaration = nullptr;
   const schema::TypeDefinition * type_decl = nullptr;
   const schema::NotationDeclaration * notation_decl = nullptr;
   const schema::SchemaModel * schema_info = nullptr;
   bool nil_flag = false;
   bool specified_flag = true;  // False if the element value was provided by the schema
   VAT attempted = VAT::NONE;
   VALIDITY validity_state = VALIDITY::NOT_KNOWN;
   std::shared_ptr<const StringList> codes;
   std::shared_ptr<const StringList> messages;
   std::optional<std::string> context;  // QName or XPath expression
   ValidatedValue schema_val;

   public:
   ValidationOutcome() = default;

   void merge_from(const ValidationOutcome &Source);

   // Producer interface

   void set_element_declaration(const schema::ElementDeclaration *Declaration) noexcept { declaration = Declaration; }
   void set_type_definition(const schema::TypeDefinition *Type) noexcept { type_decl = Type; }
   void set_notation(const schema::NotationDeclaration *Notation) noexcept { notation_decl = Notation; }
   void set_schema_information(const schema::SchemaModel *Model) noexcept { schema_info = Model; }
   void set_nil(bool Nil) noexcept { nil_flag = Nil; }
   void set_specified(bool Specified) noexcept { specified_flag = Specified; }
   void set_validation(VAT Attempted, VALIDITY Validity) noexcept;
   void set_validation_context(std::optional<std::string> Context) { context = std::move(Context); }
   void add_error(std::string Code, std::string Message);
   ERR set_errors(StringList Codes, StringList Messages);
   void clear_errors() noexcept;
   [[nodiscard]] ValidatedValue & value() noexcept { return schema_val; }

   // [schema default], [schema normalized value], [schema specified]

   [[nodiscard]] std::optional<std::string> schema_default() const;
   [[nodiscard]] const std::optional<std::string> & schema_normalized_value() const noexcept;
   [[nodiscard]] bool is_schema_specified() const noexcept { return specified_flag; }

   // [validation attempted], [validity], [schema error code], [validation context]

   [[nodiscard]] VAT validation_attempted() const noexcept { return attempted; }
   [[nodiscard]] VALIDITY validity() const noexcept { return validity_state; }
   [[nodiscard]] const StringList & error_codes() const noexcept;
   [[nodiscard]] const StringList & error_messages() const noexcept;
   [[nodiscard]] const std::optional<std::string> & validation_context() const noexcept { return context; }

   // [nil], [notation], [type definition], [member type definition], [element declaration], [schema information]

   [[nodiscard]] bool nil() const noexcept { return nil_flag; }
   [[nodiscard]] const schema::NotationDeclaration * notation() const noexcept { return notation_decl; }
   [[nodiscard]] const schema::TypeDefinition * type_definition() const noexcept { return type_decl; }
   [[nodiscard]] const schema::TypeDefinition * member_type_definition() const noexcept;
   [[nodiscard]] const schema::ElementDeclaration * element_declaration() const noexcept { return declaration; }
   [[nodiscard]] const schema::SchemaModel * schema_information() const noexcept { return schema_info; }

   // Schema value

   [[nodiscard]] const ValidatedValue & schema_value() const noexcept { return schema_val; }
   [[nodiscard]] const ActualValue & actual_normalized_value() const noexcept;
   [[nodiscard]] schema::SchemaType actual_normalized_value_type() const noexcept;
   [[nodiscard]] const KindList & item_value_types() const noexcept;
};

//********************************************************************************************************************
// Namespace-aware element node that carries PSVI data.  PSVI elements cannot be persisted because the schema
// components they reference are not persistable; save() and load() always fail with ERR::NotSerialisable.

class PSVIElement {
   private:
   ValidationOutcome psvi;

   public:
   int ID;
   std::string NamespaceURI;
   std::string QualifiedName;
   std::string LocalName;

   PSVIElement(int pID, std::string pNamespaceURI, std::string pQualifiedName);
   PSVIElement(int pID, std::string pNamespaceURI, std::string pQualifiedName, std::string pLocalName);

   void attach_outcome(const ValidationOutcome &Outcome);
   [[nodiscard]] const ValidationOutcome & outcome() const noexcept { return psvi; }

   ERR save(std::ostream &Stream) const;
   ERR load(std::istream &Stream);

   [[nodiscard]] std::optional<std::string> schema_default() const { return psvi.schema_default(); }
   [[nodiscard]] const std::optional<std::string> & schema_normalized_value() const noexcept { return psvi.schema_normalized_value(); }
   [[nodiscard]] bool is_schema_specified() const noexcept { return psvi.is_schema_specified(); }
   [[nodiscard]] VAT validation_attempted() const noexcept { return psvi.validation_attempted(); }
   [[nodiscard]] VALIDITY validity() const noexcept { return psvi.validity(); }
   [[nodiscard]] const StringList & error_codes() const noexcept { return psvi.error_codes(); }
   [[nodiscard]] const StringList & error_messages() const noexcept { return psvi.error_messages(); }
   [[nodiscard]] const std::optional<std::string> & validation_context() const noexcept { return psvi.validation_context(); }
   [[nodiscard]] bool nil() const noexcept { return psvi.nil(); }
   [[nodiscard]] const schema::NotationDeclaration * notation() const noexcept { return psvi.notation(); }
   [[nodiscard]] const schema::TypeDefinition * type_definition() const noexcept { return psvi.type_definition(); }
   [[nodiscard]] const schema::TypeDefinition * member_type_definition() const noexcept { return psvi.member_type_definition(); }
   [[nodiscard]] const schema::ElementDeclaration * element_declaration() const noexcept { return psvi.element_declaration(); }
   [[nodiscard]] const schema::SchemaModel * schema_information() const noexcept { return psvi.schema_information(); }
   [[nodiscard]] const ValidatedValue & schema_value() const noexcept { return psvi.schema_value(); }
   [[nodiscard]] const ActualValue & actual_normalized_value() const noexcept { return psvi.actual_normalized_value(); }
   [[nodiscard]] schema::SchemaType actual_normalized_value_type() const noexcept { return psvi.actual_normalized_value_type(); }
   [[nodiscard]] const KindList & item_value_types() const noexcept { return psvi.item_value_types(); }
};

} // namespace
