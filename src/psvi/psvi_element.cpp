// psvi_element.cpp - Element nodes carrying PSVI data.

#include <istream>
#include <ostream>

#include <psvi/modules/psvi.h>
#include <psvi/log.h>

namespace psvi {

PSVIElement::PSVIElement(int pID, std::string pNamespaceURI, std::string pQualifiedName)
   : ID(pID), NamespaceURI(std::move(pNamespaceURI)), QualifiedName(std::move(pQualifiedName))
{
   LocalName = std::string(schema::extract_local_name(QualifiedName));
}

PSVIElement::PSVIElement(int pID, std::string pNamespaceURI, std::string pQualifiedName, std::string pLocalName)
   : ID(pID), NamespaceURI(std::move(pNamespaceURI)), QualifiedName(std::move(pQualifiedName)),
     LocalName(std::move(pLocalName))
{
}

void PSVIElement::attach_outcome(const ValidationOutcome &Outcome)
{
   psvi::Log log(__FUNCTION__);
   log.traceBranch("Element #%d '%s'", ID, QualifiedName.c_str());
   psvi.merge_from(Outcome);
}

// Schema components cannot be persisted, so neither can an element that references them.  The stream is not touched.

ERR PSVIElement::save(std::ostream &Stream) const
{
   psvi::Log log(__FUNCTION__);
   log.warning("Element #%d '%s' carries PSVI data and cannot be serialised.", ID, QualifiedName.c_str());
   return log.warning(ERR::NotSerialisable);
}

ERR PSVIElement::load(std::istream &Stream)
{
   psvi::Log log(__FUNCTION__);
   return log.warning(ERR::NotSerialisable);
}

} // namespace
