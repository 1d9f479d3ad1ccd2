#pragma once

#include <cstdint>
#include <string>

namespace politeia
{
enum class dcr_networks
{
	mainnet,
	testnet,
	simnet
};

/** Address prefixes and chain constants of a Decred network */
class network_params
{
public:
	network_params () :
	network_params (dcr_networks::mainnet)
	{
	}
	explicit network_params (dcr_networks network_a);

	/** Sets \p network_a from its name, returns true if the name is unknown */
	static bool parse (std::string const & name_a, dcr_networks & network_a);

	dcr_networks network;
	std::string name;
	/** secp256k1 pay-to-pubkey-hash */
	uint16_t pubkey_hash_addr_id;
	uint16_t pkh_edwards_addr_id;
	uint16_t pkh_schnorr_addr_id;
	uint16_t script_hash_addr_id;
	uint16_t pubkey_addr_id;
	/** Blocks before a purchased ticket may vote, also the reorg safety depth of a snapshot */
	uint32_t ticket_maturity;
	std::string default_dcrdata_url;
};
}
