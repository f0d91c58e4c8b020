// schema_model.cpp - Implements the SchemaModel, the container that owns every type definition, element declaration
// and notation declaration of a compiled schema.  PSVI records reference these components by pointer, so the model
// never relocates a component once it has been added and rejects redefinitions rather than replacing them.

#include <psvi/modules/schema.h>
#include <psvi/log.h>

namespace psvi::schema
{
   namespace
   {
      [[nodiscard]] std::string make_qualified_name(std::string_view Prefix, std::string_view LocalName)
      {
         if (Prefix.empty()) return std::string(LocalName);
         std::string qualified;
         qualified.reserve(Prefix.size() + LocalName.size() + 1u);
         qualified.append(Prefix);
         qualified.push_back(':');
         qualified.append(LocalName);
         return qualified;
      }

      // Lookups accept either the declared name or a prefixed form of it.

      template<typename Value>
      [[nodiscard]] const Value * find_component(const ankerl::unordered_dense::map<std::string, std::unique_ptr<Value>> &Map,
         std::string_view Name)
      {
         auto iter = Map.find(std::string(Name));
         if (iter != Map.end()) return iter->second.get();

         auto local_name = extract_local_name(Name);
         if (local_name.size() IS Name.size()) return nullptr;

         iter = Map.find(std::string(local_name));
         if (iter != Map.end()) return iter->second.get();
         return nullptr;
      }
   }

   SchemaModel::SchemaModel(std::string TargetNamespace, SchemaTypeRegistry &Registry)
      : registry_ref(&Registry), target_namespace(std::move(TargetNamespace))
   {
   }

   // Declares a named simple type.  List types require an item type and union types at least one member type.

   const TypeDefinition * SchemaModel::add_simple_type(std::string Name, SimpleTypeInfo Info, const TypeDefinition *Base)
   {
      psvi::Log log(__FUNCTION__);

      if (Name.empty()) { log.warning(ERR::NullArgs); return nullptr; }

      auto local_name = std::string(extract_local_name(Name));
      if (types.contains(local_name)) {
         log.warning("Type '%s': %s", Name.c_str(), GetErrorMsg(ERR::Exists));
         return nullptr;
      }

      if ((Info.variety IS Variety::List) and (not Info.item_type)) {
         log.warning("List type '%s' has no item type.", Name.c_str());
         return nullptr;
      }

      if (Info.variety IS Variety::Union) {
         if (Info.member_types.empty()) {
            log.warning("Union type '%s' has no member types.", Name.c_str());
            return nullptr;
         }

         for (auto member : Info.member_types) {
            if ((not member) or (not member->is_simple())) {
               log.warning("Union type '%s' has a member that is not a simple type.", Name.c_str());
               return nullptr;
            }
         }
      }

      if (not Base) {
         if (Info.variety IS Variety::Atomic) Base = registry_ref->find_descriptor(Info.builtin_kind);
         if (not Base) Base = registry_ref->find_descriptor(SchemaType::XSAnySimpleType);
      }
      else if (not Base->is_simple()) {
         log.warning("Simple type '%s' cannot derive from complex type '%s'.", Name.c_str(), Base->type_name.c_str());
         return nullptr;
      }

      // Restrictions of an atomic type inherit its primitive kind.
      if ((Info.variety IS Variety::Atomic) and (Info.builtin_kind IS SchemaType::XSAnySimpleType)) {
         if (auto base_info = Base ? Base->simple() : nullptr) {
            if (base_info->variety IS Variety::Atomic) Info.builtin_kind = base_info->builtin_kind;
         }
      }

      log.detail("Simple type %s, variety %d", Name.c_str(), int(Info.variety));

      auto definition = std::make_unique<TypeDefinition>(std::move(Name), target_namespace, std::move(Info), Base);
      auto result = definition.get();
      types.emplace(std::move(local_name), std::move(definition));
      return result;
   }

   // Declares a named complex type.  A simple content type is mandatory when the content type is ContentType::Simple.

   const TypeDefinition * SchemaModel::add_complex_type(std::string Name, ComplexTypeInfo Info, const TypeDefinition *Base)
   {
      psvi::Log log(__FUNCTION__);

      if (Name.empty()) { log.warning(ERR::NullArgs); return nullptr; }

      auto local_name = std::string(extract_local_name(Name));
      if (types.contains(local_name)) {
         log.warning("Type '%s': %s", Name.c_str(), GetErrorMsg(ERR::Exists));
         return nullptr;
      }

      if (Info.content_type IS ContentType::Simple) {
         if ((not Info.simple_content) or (not Info.simple_content->is_simple())) {
            log.warning("Complex type '%s' declares simple content without a simple content type.", Name.c_str());
            return nullptr;
         }
      }
      else Info.simple_content = nullptr;

      if (not Base) Base = registry_ref->any_type();

      log.detail("Complex type %s, content %d", Name.c_str(), int(Info.content_type));

      auto definition = std::make_unique<TypeDefinition>(std::move(Name), target_namespace, std::move(Info), Base);
      auto result = definition.get();
      types.emplace(std::move(local_name), std::move(definition));
      return result;
   }

   // Declares a global element.  The type is resolved from type_name if no type reference is given; an element
   // without either is typed as xs:anyType.

   const ElementDeclaration * SchemaModel::add_element(ElementDeclaration Declaration)
   {
      psvi::Log log(__FUNCTION__);

      if (Declaration.name.empty()) { log.warning(ERR::NullArgs); return nullptr; }

      auto local_name = std::string(extract_local_name(Declaration.name));
      if (elements.contains(local_name)) {
         log.warning("Element '%s': %s", Declaration.name.c_str(), GetErrorMsg(ERR::Exists));
         return nullptr;
      }

      if (not Declaration.type) {
         if (not Declaration.type_name.empty()) {
            Declaration.type = find_type(Declaration.type_name);
            if (not Declaration.type) {
               log.warning("Element '%s', type '%s': %s", Declaration.name.c_str(), Declaration.type_name.c_str(),
                  GetErrorMsg(ERR::NotFound));
               return nullptr;
            }
         }
         else Declaration.type = registry_ref->any_type();
      }

      if (Declaration.type_name.empty()) Declaration.type_name = Declaration.type->type_name;

      if (Declaration.constraint_type IS VC::NONE) Declaration.constraint_value.reset();
      else if (not Declaration.constraint_value) {
         log.warning("Element '%s' declares a value constraint without a value.", Declaration.name.c_str());
         return nullptr;
      }

      if (Declaration.namespace_uri.empty()) Declaration.namespace_uri = target_namespace;
      if (Declaration.qualified_name.empty()) {
         Declaration.qualified_name = make_qualified_name(target_namespace_prefix, local_name);
      }

      auto declaration = std::make_unique<ElementDeclaration>(std::move(Declaration));
      auto result = declaration.get();
      elements.emplace(std::move(local_name), std::move(declaration));
      return result;
   }

   const NotationDeclaration * SchemaModel::add_notation(NotationDeclaration Declaration)
   {
      psvi::Log log(__FUNCTION__);

      if (Declaration.name.empty()) { log.warning(ERR::NullArgs); return nullptr; }

      auto local_name = std::string(extract_local_name(Declaration.name));
      if (notations.contains(local_name)) {
         log.warning("Notation '%s': %s", Declaration.name.c_str(), GetErrorMsg(ERR::Exists));
         return nullptr;
      }

      if (Declaration.namespace_uri.empty()) Declaration.namespace_uri = target_namespace;

      auto declaration = std::make_unique<NotationDeclaration>(std::move(Declaration));
      auto result = declaration.get();
      notations.emplace(std::move(local_name), std::move(declaration));
      return result;
   }

   // Resolves a type name against the built-in registry (xs:/xsd: prefixed names) and then the model's own declarations.

   const TypeDefinition * SchemaModel::find_type(std::string_view Name) const
   {
      if (Name.empty()) return nullptr;
      if (auto result = registry_ref->find_descriptor(Name)) return result;
      return find_component(types, Name);
   }

   const ElementDeclaration * SchemaModel::find_element(std::string_view Name) const
   {
      if (Name.empty()) return nullptr;
      return find_component(elements, Name);
   }

   const NotationDeclaration * SchemaModel::find_notation(std::string_view Name) const
   {
      if (Name.empty()) return nullptr;
      return find_component(notations, Name);
   }

   SchemaTypeRegistry & SchemaModel::type_registry() const
   {
      return *registry_ref;
   }

   bool SchemaModel::empty() const noexcept
   {
      return types.empty() and elements.empty() and notations.empty();
   }
}
