#pragma once

#include <xmppxx/config.hpp>
#include <xmppxx/detail/result.hpp>
#include <xmppxx/detail/log.hpp>

#include <xmppxx/codec/base64.hpp>

#include <xmppxx/net/dialog.hpp>
#include <xmppxx/net/tls_mode.hpp>
#include <xmppxx/net/tls_options.hpp>
#include <xmppxx/net/upgradable_stream.hpp>

#include <xmppxx/xml/qname.hpp>
#include <xmppxx/xml/token_reader.hpp>
#include <xmppxx/xml/element.hpp>

#include <xmppxx/stanza/namespaces.hpp>
#include <xmppxx/stanza/types.hpp>
#include <xmppxx/stanza/decoder.hpp>
#include <xmppxx/stanza/encoder.hpp>

#include <xmppxx/client/types.hpp>
#include <xmppxx/client/client.hpp>
