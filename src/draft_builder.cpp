#include "mailjmap/draft_builder.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_utils.hpp"

#include "MailCore/MailCore.h"

using namespace mailcore;

static std::vector<ParsedAddress> addressListFromJSON(const nlohmann::json & value, std::string property) {
    std::vector<ParsedAddress> list;
    if (value.is_null()) {
        return list;
    }
    if (!value.is_array()) {
        throw JMAPError("invalidProperties", property + " must be an array of addresses", {property});
    }
    for (const auto & entry : value) {
        if (!entry.is_object() || !entry.count("email") || !entry["email"].is_string()) {
            continue;
        }
        std::string email = MailUtils::trim(entry["email"].get<std::string>());
        if (email == "") {
            continue;
        }
        std::string name = "";
        if (entry.count("name") && entry["name"].is_string()) {
            name = entry["name"].get<std::string>();
        }
        list.push_back(ParsedAddress{name, email});
    }
    return list;
}

// Accepts a plain string or the JMAP [{partId}] + bodyValues form.
static bool bodyFromJSON(const nlohmann::json & create, std::string property, std::string * out) {
    if (!create.count(property)) {
        return false;
    }
    const nlohmann::json & value = create[property];
    if (value.is_string()) {
        *out = value.get<std::string>();
        return true;
    }
    if (value.is_array() && value.size() > 0 && value[0].is_object() && value[0].count("partId")) {
        std::string partId = value[0]["partId"].is_string() ? value[0]["partId"].get<std::string>() : "";
        if (create.count("bodyValues") && create["bodyValues"].count(partId)) {
            const nlohmann::json & bv = create["bodyValues"][partId];
            if (bv.is_object() && bv.count("value") && bv["value"].is_string()) {
                *out = bv["value"].get<std::string>();
                return true;
            }
        }
        throw JMAPError("invalidProperties", property + " references a missing body value", {property});
    }
    return false;
}

static Address * addressFromParsed(const ParsedAddress & addr) {
    if (addr.name != "") {
        return Address::addressWithDisplayName(AS_MCSTR(addr.name), AS_MCSTR(addr.email));
    }
    return Address::addressWithMailbox(AS_MCSTR(addr.email));
}

static Array * arrayFromParsed(const std::vector<ParsedAddress> & list) {
    Array * result = Array::array();
    for (const auto & addr : list) {
        result->addObject(addressFromParsed(addr));
    }
    return result;
}

DraftBuilder::DraftBuilder(std::string mailDomain) : mailDomain(mailDomain) {
}

bool DraftBuilder::IsStructuredDraft(const nlohmann::json & create) {
    for (const char * key : {"textBody", "htmlBody", "subject", "from", "to", "cc", "bcc", "replyTo", "attachments"}) {
        if (create.count(key)) {
            return true;
        }
    }
    return false;
}

// null or String[]
static std::vector<std::string> messageIdListFromJSON(const nlohmann::json & create, const char * key) {
    std::vector<std::string> ids;
    if (!create.count(key) || create[key].is_null()) {
        return ids;
    }
    const nlohmann::json & list = create[key];
    if (!list.is_array()) {
        throw JMAPError("invalidProperties", std::string(key) + " must be an array of message ids", {key});
    }
    for (const auto & id : list) {
        if (!id.is_string()) {
            throw JMAPError("invalidProperties", std::string(key) + " must contain only strings", {key});
        }
        ids.push_back(MailUtils::normalizeMessageId(id.get<std::string>()));
    }
    return ids;
}

Draft DraftBuilder::FromJMAP(const nlohmann::json & create) {
    Draft draft;
    draft.hasText = bodyFromJSON(create, "textBody", &draft.text);
    draft.hasHTML = bodyFromJSON(create, "htmlBody", &draft.html);

    if (!draft.hasText && !draft.hasHTML) {
        throw JMAPError("invalidProperties", "Either textBody or htmlBody must be provided when creating an Email without blobId", {"textBody", "htmlBody"});
    }

    draft.from = addressListFromJSON(create.count("from") ? create["from"] : nlohmann::json(), "from");
    if (draft.from.size() == 0) {
        throw JMAPError("invalidProperties", "from must include at least one address", {"from"});
    }
    draft.to = addressListFromJSON(create.count("to") ? create["to"] : nlohmann::json(), "to");
    draft.cc = addressListFromJSON(create.count("cc") ? create["cc"] : nlohmann::json(), "cc");
    draft.bcc = addressListFromJSON(create.count("bcc") ? create["bcc"] : nlohmann::json(), "bcc");
    draft.replyTo = addressListFromJSON(create.count("replyTo") ? create["replyTo"] : nlohmann::json(), "replyTo");

    if (create.count("subject") && create["subject"].is_string()) {
        draft.subject = create["subject"].get<std::string>();
    }

    std::vector<std::string> inReplyTo = messageIdListFromJSON(create, "inReplyTo");
    if (inReplyTo.size()) {
        draft.inReplyTo = inReplyTo[0];
    }
    draft.references = messageIdListFromJSON(create, "references");

    if (create.count("attachments")) {
        const nlohmann::json & list = create["attachments"];
        if (!list.is_array()) {
            throw JMAPError("invalidProperties", "attachments must be an array", {"attachments"});
        }
        for (const auto & entry : list) {
            if (!entry.is_object() || !entry.count("blobId") || !entry["blobId"].is_string()) {
                throw JMAPError("invalidProperties", "Each attachment needs a blobId", {"attachments"});
            }
            DraftAttachment att;
            att.blobId = entry["blobId"].get<std::string>();
            att.mimeType = entry.count("type") && entry["type"].is_string() ? entry["type"].get<std::string>() : "application/octet-stream";
            att.filename = entry.count("name") && entry["name"].is_string() ? entry["name"].get<std::string>() : "";
            att.contentId = entry.count("cid") && entry["cid"].is_string() ? entry["cid"].get<std::string>() : "";
            att.isInline = entry.count("disposition") && entry["disposition"] == "inline";
            draft.attachments.push_back(att);
        }
    }
    return draft;
}

std::string DraftBuilder::newMessageId() {
    return MailUtils::idRandomlyGenerated() + "@" + mailDomain;
}

std::string DraftBuilder::build(const Draft & draft) {
    AutoreleasePool pool;
    MessageBuilder builder;

    if (draft.hasText) {
        builder.setTextBody(AS_MCSTR(draft.text));
    }
    if (draft.hasHTML) {
        builder.setHTMLBody(AS_MCSTR(draft.html));
    }

    builder.header()->setSubject(AS_MCSTR(draft.subject));
    builder.header()->setMessageID(AS_MCSTR(newMessageId()));
    builder.header()->setUserAgent(MCSTR("MailJMAP"));
    builder.header()->setDate(time(0));

    if (draft.inReplyTo != "") {
        builder.header()->setInReplyTo(Array::arrayWithObject(AS_MCSTR(draft.inReplyTo)));
    }
    if (draft.references.size()) {
        Array * refs = Array::array();
        for (const auto & ref : draft.references) {
            refs->addObject(AS_MCSTR(ref));
        }
        builder.header()->setReferences(refs);
    }

    builder.header()->setFrom(addressFromParsed(draft.from.at(0)));
    builder.header()->setTo(arrayFromParsed(draft.to));
    builder.header()->setCc(arrayFromParsed(draft.cc));
    builder.header()->setBcc(arrayFromParsed(draft.bcc));
    builder.header()->setReplyTo(arrayFromParsed(draft.replyTo));

    for (const auto & att : draft.attachments) {
        String * filename = att.filename != "" ? AS_MCSTR(att.filename) : nullptr;
        Attachment * a = Attachment::attachmentWithData(filename, Data::dataWithBytes(att.bytes.data(), (unsigned int)att.bytes.size()));
        a->setMimeType(AS_MCSTR(att.mimeType));
        if (att.contentId != "") {
            a->setContentID(AS_MCSTR(att.contentId));
        }
        if (att.isInline) {
            a->setInlineAttachment(true);
            builder.addRelatedAttachment(a);
        } else {
            builder.addAttachment(a);
        }
    }

    Data * data = builder.data();
    return std::string(data->bytes(), data->length());
}
