// schema.h - Declares the schema component model referenced by PSVI records: type definitions, element and
// notation declarations, the built-in type registry and the SchemaModel that owns them.
//
// Schema components are shared, read-only objects.  PSVI records never own them; they hold plain const pointers
// into a SchemaModel (or the global registry) which must outlive every record that references it.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <ankerl/unordered_dense.h>
#include <psvi/main.h>

namespace psvi::schema
{
   // Value kinds for actual values.  Also used to tag built-in simple types.

   enum class SchemaType
   {
      XSAnyType,
      XSAnySimpleType,
      XSString,
      XSBoolean,
      XSDecimal,
      XSFloat,
      XSDouble,
      XSDuration,
      XSDateTime,
      XSTime,
      XSDate,
      XSHexBinary,
      XSBase64Binary,
      XSAnyURI,
      XSQName,
      XSNotation,
      XSNormalizedString,
      XSToken,
      XSLanguage,
      XSName,
      XSNCName,
      XSID,
      XSIDRef,
      XSInteger,
      XSNonNegativeInteger,
      XSPositiveInteger,
      XSLong,
      XSInt,
      XSShort,
      XSByte,
      XSUnsignedLong,
      XSUnsignedInt,
      XSUnsignedShort,
      XSUnsignedByte,
      List,
      ListOfUnion,
      Unavailable
   };

   enum class Variety { Atomic, List, Union };

   enum class ContentType { Empty, Simple, ElementOnly, Mixed };

   // Element value constraint

   enum class VC { NONE, DEFAULT, FIXED };

   class TypeDefinition;

   struct SimpleTypeInfo
   {
      Variety variety = Variety::Atomic;
      SchemaType builtin_kind = SchemaType::XSAnySimpleType; // Kind of the primitive that atomic values reduce to
      const TypeDefinition * item_type = nullptr;             // Variety::List only
      std::vector<const TypeDefinition *> member_types;      // Variety::Union only
   };

   struct ComplexTypeInfo
   {
      ContentType content_type = ContentType::Empty;
      const TypeDefinition * simple_content = nullptr;        // ContentType::Simple only
   };

   class TypeDefinition
   {
      private:
      const TypeDefinition * base_type;
      bool builtin_type;

      public:
      std::string type_name;
      std::string namespace_uri;
      std::string local_name;
      std::variant<SimpleTypeInfo, ComplexTypeInfo> info;

      TypeDefinition(std::string Name, std::string NamespaceURI, SimpleTypeInfo Info,
                     const TypeDefinition *Base = nullptr, bool Builtin = false);
      TypeDefinition(std::string Name, std::string NamespaceURI, ComplexTypeInfo Info,
                     const TypeDefinition *Base = nullptr, bool Builtin = false);

      [[nodiscard]] const TypeDefinition * base() const noexcept;
      [[nodiscard]] bool is_builtin() const noexcept;
      [[nodiscard]] bool is_simple() const noexcept;
      [[nodiscard]] bool is_complex() const noexcept;
      [[nodiscard]] const SimpleTypeInfo * simple() const noexcept;
      [[nodiscard]] const ComplexTypeInfo * complex() const noexcept;
      [[nodiscard]] bool has_simple_value() const noexcept;
      [[nodiscard]] const TypeDefinition * value_type() const noexcept;
      [[nodiscard]] bool is_union() const noexcept;
      [[nodiscard]] SchemaType value_kind() const noexcept;
      [[nodiscard]] bool is_derived_from(SchemaType Target) const noexcept;
      [[nodiscard]] bool is_derived_from(const TypeDefinition &Target) const noexcept;
   };

   struct ElementDeclaration
   {
      std::string name;
      std::string namespace_uri;
      std::string qualified_name;
      std::string type_name;
      const TypeDefinition * type = nullptr;
      VC constraint_type = VC::NONE;
      std::optional<std::string> constraint_value;
      bool nillable = false;
   };

   struct NotationDeclaration
   {
      std::string name;
      std::string namespace_uri;
      std::string public_id;
      std::string system_id;
   };

   class SchemaTypeRegistry
   {
      private:
      ankerl::unordered_dense::map<SchemaType, std::shared_ptr<TypeDefinition>> descriptors_by_type;
      ankerl::unordered_dense::map<std::string, std::shared_ptr<TypeDefinition>> descriptors_by_name;

      void register_builtin_types();

      public:
      SchemaTypeRegistry();

      const TypeDefinition * register_descriptor(SchemaType Type, std::string Name, const TypeDefinition *Base);
      [[nodiscard]] const TypeDefinition * find_descriptor(SchemaType Type) const;
      [[nodiscard]] const TypeDefinition * find_descriptor(std::string_view Name) const;
      [[nodiscard]] const TypeDefinition * any_type() const;
      [[nodiscard]] size_t size() const noexcept;
   };

   SchemaTypeRegistry & registry();

   // The [schema information] item.  Owns every component declared in it; components are addressed by const pointer
   // and remain valid for the lifetime of the model, which is why the model cannot be copied.

   class SchemaModel
   {
      private:
      SchemaTypeRegistry * registry_ref;
      ankerl::unordered_dense::map<std::string, std::unique_ptr<TypeDefinition>> types;
      ankerl::unordered_dense::map<std::string, std::unique_ptr<ElementDeclaration>> elements;
      ankerl::unordered_dense::map<std::string, std::unique_ptr<NotationDeclaration>> notations;

      public:
      std::string target_namespace;
      std::string target_namespace_prefix;

      explicit SchemaModel(std::string TargetNamespace = std::string(), SchemaTypeRegistry &Registry = registry());
      SchemaModel(const SchemaModel &) = delete;
      SchemaModel & operator=(const SchemaModel &) = delete;

      const TypeDefinition * add_simple_type(std::string Name, SimpleTypeInfo Info, const TypeDefinition *Base = nullptr);
      const TypeDefinition * add_complex_type(std::string Name, ComplexTypeInfo Info, const TypeDefinition *Base = nullptr);
      const ElementDeclaration * add_element(ElementDeclaration Declaration);
      const NotationDeclaration * add_notation(NotationDeclaration Declaration);

      [[nodiscard]] const TypeDefinition * find_type(std::string_view Name) const;
      [[nodiscard]] const ElementDeclaration * find_element(std::string_view Name) const;
      [[nodiscard]] const NotationDeclaration * find_notation(std::string_view Name) const;
      [[nodiscard]] SchemaTypeRegistry & type_registry() const;
      [[nodiscard]] bool empty() const noexcept;
   };

   [[nodiscard]] bool is_numeric(SchemaType Type) noexcept;
   [[nodiscard]] bool is_string_like(SchemaType Type) noexcept;
   [[nodiscard]] std::string_view extract_local_name(std::string_view Qualified) noexcept;
}
